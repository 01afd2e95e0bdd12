#include "pickcal/ConsoleConfig.h"
#include "gtest/gtest.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

using namespace pickcal;

namespace {

QJsonObject parse(const char *json)
{
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

TEST(ConsoleConfigTest, DefaultsDescribeSingleOpenCvCamera)
{
    const ConsoleConfig config;
    EXPECT_EQ(config.display.displaySize, cv::Size(640, 480));
    EXPECT_EQ(config.statusLogCapacity, 500u);
    EXPECT_EQ(config.cameras[0].backend, QStringLiteral("opencv"));
    EXPECT_TRUE(config.cameras[0].powered);
    EXPECT_EQ(config.cameras[1].backend, QStringLiteral("none"));
    EXPECT_FALSE(config.cameras[2].powered);
    EXPECT_EQ(config.activeSource, 0);
    EXPECT_EQ(config.calibration.maxAttemptsPerCell, 3);
    EXPECT_EQ(config.calibration.reportDirectory, QStringLiteral("calibration"));
    EXPECT_EQ(config.targets.chessboard.cols, 9);
    EXPECT_EQ(config.targets.aruco.dictionary, QStringLiteral("DICT_4X4_50"));

    QString error;
    EXPECT_TRUE(config.validate(&error)) << error.toStdString();
}

TEST(ConsoleConfigTest, JsonOverridesOnlyGivenKeys)
{
    ConsoleConfig config;
    QString error;
    ASSERT_TRUE(config.fromJson(parse(R"({
        "display": { "width": 800 },
        "cameras": [ {}, { "backend": "OpenCV", "device": "rtsp://10.0.0.5/stream", "powered": true } ],
        "activeSource": 1,
        "calibration": { "maxAttemptsPerCell": 5, "reportDirectory": "" },
        "targets": { "aruco": { "dictionary": "DICT_6X6_250", "markerId": 3 } }
    })"), &error)) << error.toStdString();

    EXPECT_EQ(config.display.displaySize, cv::Size(800, 480));
    EXPECT_EQ(config.cameras[0].name, QStringLiteral("Top camera"));
    EXPECT_EQ(config.cameras[1].backend, QStringLiteral("opencv"));
    EXPECT_EQ(config.cameras[1].device, QStringLiteral("rtsp://10.0.0.5/stream"));
    EXPECT_EQ(config.activeSource, 1);
    EXPECT_EQ(config.calibration.maxAttemptsPerCell, 5);
    EXPECT_TRUE(config.calibration.reportDirectory.isEmpty());
    EXPECT_EQ(config.targets.aruco.markerId, 3);
    EXPECT_EQ(config.targets.chessboard.rows, 6);
}

TEST(ConsoleConfigTest, InvalidValuesAreRejectedAndLeaveConfigUntouched)
{
    ConsoleConfig config;
    QString error;

    EXPECT_FALSE(config.fromJson(parse(R"({ "activeSource": 3 })"), &error));
    EXPECT_TRUE(error.contains(QStringLiteral("activeSource")));
    EXPECT_EQ(config.activeSource, 0);

    EXPECT_FALSE(config.fromJson(parse(R"({ "display": { "width": "wide" } })"), &error));
    EXPECT_TRUE(error.contains(QStringLiteral("display.width")));

    EXPECT_FALSE(config.fromJson(parse(R"({ "cameras": [ { "backend": "firewire" } ] })"), &error));
    EXPECT_TRUE(error.contains(QStringLiteral("firewire")));

    EXPECT_FALSE(config.fromJson(parse(R"({ "cameras": [ {}, {}, {}, {} ] })"), &error));
    EXPECT_FALSE(config.fromJson(parse(R"({ "targets": { "aruco": { "dictionary": "DICT_1X1" } } })"), &error));
    EXPECT_FALSE(config.fromJson(parse(R"({ "calibration": { "maxAttemptsPerCell": 0 } })"), &error));
    EXPECT_FALSE(config.fromJson(parse(R"({ "statusLog": { "capacity": 2.5 } })"), &error));
}

TEST(ConsoleConfigTest, RejectsIntegersBeyondRange)
{
    ConsoleConfig config;
    QString error;

    EXPECT_FALSE(config.fromJson(parse(R"({ "statusLog": { "capacity": 1e12 } })"), &error));
    EXPECT_TRUE(error.contains(QStringLiteral("statusLog.capacity")));
    EXPECT_EQ(config.statusLogCapacity, ConsoleConfig().statusLogCapacity);

    EXPECT_FALSE(config.fromJson(parse(R"({ "display": { "width": -3e10 } })"), &error));
    EXPECT_TRUE(error.contains(QStringLiteral("out of range")));

    EXPECT_FALSE(config.fromJson(parse(R"({ "calibration": { "maxGridDimension": 100000 } })"), &error));
    EXPECT_TRUE(error.contains(QStringLiteral("maxGridDimension")));
    EXPECT_EQ(config.calibration.maxGridDimension, ConsoleConfig().calibration.maxGridDimension);

    EXPECT_TRUE(config.fromJson(parse(R"({ "calibration": { "maxGridDimension": 1024 } })"), &error))
        << error.toStdString();
}

TEST(ConsoleConfigTest, RoundTripsThroughFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("pickcal.json"));

    ConsoleConfig written;
    written.recording.path = QStringLiteral("live.mp4");
    written.cameras[2].backend = QStringLiteral("vimba");
    written.cameras[2].device = QStringLiteral("DEV_000F314C4B2A");
    QString error;
    ASSERT_TRUE(written.saveToFile(path, &error)) << error.toStdString();

    ConsoleConfig loaded;
    ASSERT_TRUE(loaded.loadFromFile(path, &error)) << error.toStdString();
    EXPECT_EQ(loaded.recording.path, QStringLiteral("live.mp4"));
    EXPECT_EQ(loaded.cameras[2].backend, QStringLiteral("vimba"));
    EXPECT_EQ(loaded.cameras[2].device, QStringLiteral("DEV_000F314C4B2A"));
}

TEST(ConsoleConfigTest, BrokenFileReportsError)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = QDir(dir.path()).filePath(QStringLiteral("broken.json"));
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("{ \"display\": ");
    file.close();

    ConsoleConfig config;
    QString error;
    EXPECT_FALSE(config.loadFromFile(path, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("Invalid config JSON")));

    EXPECT_FALSE(config.loadFromFile(QDir(dir.path()).filePath(QStringLiteral("missing.json")), &error));
}
