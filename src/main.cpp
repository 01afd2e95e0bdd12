#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QImage>
#include <QSocketNotifier>
#include <QStringList>
#include <QTextStream>
#include <QTimer>

#include <cerrno>
#include <cstdio>
#include <memory>

#include <unistd.h>

#include "pickcal/ConsoleConfig.h"
#include "pickcal/ConsoleCoordinator.h"
#include "pickcal/ConsoleInput.h"

namespace {

using pickcal::ConsoleCoordinator;
using pickcal::OperationResult;

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

void printResult(const OperationResult &result)
{
    if (result.success) {
        out() << "ok" << (result.message.isEmpty() ? QString() : QStringLiteral(": ") + result.message) << Qt::endl;
    } else {
        out() << "error " << pickcal::errorCodeName(result.error) << ": " << result.message << Qt::endl;
    }
}

void printStatus(const ConsoleCoordinator &console)
{
    for (const auto &slot : console.cameraSlots()) {
        out() << (slot.active ? "* " : "  ") << slot.id << " " << slot.name << " [" << slot.backend << "] "
              << (slot.powered ? "on" : "off") << (slot.open ? ", open" : "") << ", frames " << slot.framesCaptured
              << Qt::endl;
    }

    const auto status = console.calibrationStatus();
    out() << "calibration: " << pickcal::sessionStateName(status.state);
    if (status.target) {
        out() << " " << pickcal::calibrationTargetName(*status.target) << " " << status.gridRows << "x"
              << status.gridCols << ", " << status.capturedCount << "/" << status.totalCells << " points";
    }
    if (!status.lastMessage.isEmpty()) {
        out() << " (" << status.lastMessage << ")";
    }
    out() << Qt::endl;

    const auto result = console.lastCalibrationResult();
    if (result && result->success) {
        out() << "mapping: mean " << QString::number(result->meanErrorMm, 'f', 3) << " mm, max "
              << QString::number(result->maxErrorMm, 'f', 3) << " mm";
        if (result->intrinsicsSolved) {
            out() << ", intrinsics RMS " << QString::number(result->rms, 'f', 3) << " px";
        }
        out() << Qt::endl;
    }
}

bool parseSourceId(const QString &text, int *source)
{
    bool ok = false;
    *source = text.toInt(&ok);
    return ok;
}

// Returns false when the operator asked to quit.
bool handleCommand(const QString &line, ConsoleCoordinator &console, const QImage &lastImage)
{
    const QStringList words = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (words.isEmpty()) {
        return true;
    }
    const QString verb = words.first().toLower();

    if (verb == QLatin1String("quit") || verb == QLatin1String("exit")) {
        return false;
    }
    if (verb == QLatin1String("select") && words.size() == 2) {
        int source = -1;
        if (!parseSourceId(words.at(1), &source)) {
            out() << "error: camera id must be a number" << Qt::endl;
            return true;
        }
        printResult(console.submit(pickcal::SelectCommand {source}));
        return true;
    }
    if (verb == QLatin1String("power") && words.size() == 3) {
        int source = -1;
        const QString state = words.at(2).toLower();
        if (!parseSourceId(words.at(1), &source) || (state != QLatin1String("on") && state != QLatin1String("off"))) {
            out() << "usage: power <id> on|off" << Qt::endl;
            return true;
        }
        printResult(console.submit(pickcal::PowerCommand {source, state == QLatin1String("on")}));
        return true;
    }
    if (verb == QLatin1String("calibrate") && words.size() == 6) {
        bool targetOk = false;
        bool rowsOk = false;
        bool colsOk = false;
        const int target = words.at(1).toInt(&targetOk);
        const int rows = words.at(2).toInt(&rowsOk);
        const int cols = words.at(3).toInt(&colsOk);
        if (!targetOk || !rowsOk || !colsOk) {
            out() << "usage: calibrate <target 0|1|2> <rows> <cols> <x_mm> <y_mm>" << Qt::endl;
            return true;
        }
        printResult(console.calibrationStep(target, rows, cols, words.at(4), words.at(5)));
        return true;
    }
    if (verb == QLatin1String("reset")) {
        printResult(console.submit(pickcal::ResetCommand {}));
        return true;
    }
    if (verb == QLatin1String("status")) {
        printStatus(console);
        return true;
    }
    if (verb == QLatin1String("snapshot") && words.size() == 2) {
        if (lastImage.isNull() || !lastImage.save(words.at(1))) {
            out() << "error: could not write " << words.at(1) << Qt::endl;
        } else {
            out() << "ok: wrote " << words.at(1) << Qt::endl;
        }
        return true;
    }
    if (verb == QLatin1String("log")) {
        int count = 20;
        if (words.size() == 2) {
            bool ok = false;
            count = words.at(1).toInt(&ok);
            if (!ok || count < 1) {
                out() << "usage: log [n]" << Qt::endl;
                return true;
            }
        }
        for (const auto &entry : console.statusLog().tail(static_cast<std::size_t>(count))) {
            out() << entry.formatted() << Qt::endl;
        }
        return true;
    }

    out() << "commands: select <id> | power <id> on|off | calibrate <target> <rows> <cols> <x> <y> | reset | "
             "status | snapshot <file.png> | log [n] | quit"
          << Qt::endl;
    return true;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("pickcal-console"));
    QCoreApplication::setOrganizationName(QStringLiteral("PickCal"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Pick-and-place camera console: live view and calibration capture"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                    QStringLiteral("JSON configuration file."),
                                    QStringLiteral("file"));
    QCommandLineOption sourceOption({QStringLiteral("s"), QStringLiteral("source")},
                                    QStringLiteral("Camera slot selected at startup (0-2)."),
                                    QStringLiteral("id"));
    QCommandLineOption recordOption({QStringLiteral("r"), QStringLiteral("record")},
                                    QStringLiteral("Record live frames to this video file."),
                                    QStringLiteral("file"));
    QCommandLineOption intervalOption(QStringLiteral("frame-interval"),
                                      QStringLiteral("Viewport tick interval in milliseconds."),
                                      QStringLiteral("ms"));
    QCommandLineOption framesOption(QStringLiteral("frames"),
                                    QStringLiteral("Quit after rendering this many frames."),
                                    QStringLiteral("count"));
    QCommandLineOption writeConfigOption(QStringLiteral("write-config"),
                                         QStringLiteral("Write the effective configuration to a file and exit."),
                                         QStringLiteral("file"));

    parser.addOption(configOption);
    parser.addOption(sourceOption);
    parser.addOption(recordOption);
    parser.addOption(intervalOption);
    parser.addOption(framesOption);
    parser.addOption(writeConfigOption);

    parser.process(app);

    pickcal::ConsoleConfig config;
    QString error;
    if (parser.isSet(configOption) && !config.loadFromFile(parser.value(configOption), &error)) {
        QTextStream(stderr) << "Configuration error: " << error << Qt::endl;
        return 1;
    }

    auto parseInt = [&](const QCommandLineOption &option, int minimum, int &target) -> bool {
        if (!parser.isSet(option)) {
            return true;
        }
        bool ok = false;
        const int value = parser.value(option).toInt(&ok);
        if (!ok || value < minimum) {
            QTextStream(stderr) << "Invalid value for --" << option.names().constLast() << ": "
                                << parser.value(option) << Qt::endl;
            return false;
        }
        target = value;
        return true;
    };

    int intervalMs = static_cast<int>(config.display.frameInterval.count());
    int frameLimit = 0;
    if (!parseInt(sourceOption, -1, config.activeSource) || !parseInt(intervalOption, 1, intervalMs) ||
        !parseInt(framesOption, 0, frameLimit)) {
        return 1;
    }
    config.display.frameInterval = std::chrono::milliseconds(intervalMs);
    if (parser.isSet(recordOption)) {
        config.recording.path = parser.value(recordOption);
    }
    if (!config.validate(&error)) {
        QTextStream(stderr) << "Configuration error: " << error << Qt::endl;
        return 1;
    }

    if (parser.isSet(writeConfigOption)) {
        if (!config.saveToFile(parser.value(writeConfigOption), &error)) {
            QTextStream(stderr) << error << Qt::endl;
            return 1;
        }
        return 0;
    }

    ConsoleCoordinator console(config);

    quint64 printedSequence = 0;
    auto printNewLines = [&console, &printedSequence]() {
        for (const auto &entry : console.statusLog().linesAfter(printedSequence)) {
            out() << entry.formatted() << Qt::endl;
            printedSequence = entry.sequence;
        }
    };
    printNewLines();

    qint64 frameIndex = 0;
    QImage lastImage;
    QTimer ticker;
    ticker.setInterval(intervalMs);
    QObject::connect(&ticker, &QTimer::timeout, &app, [&]() {
        lastImage = console.renderImage(frameIndex++);
        printNewLines();
        if (frameLimit > 0 && frameIndex >= frameLimit) {
            QCoreApplication::quit();
        }
    });
    ticker.start();

    pickcal::CommandLineBuffer commandBuffer;
    QSocketNotifier stdinNotifier(STDIN_FILENO, QSocketNotifier::Read);
    auto runCommand = [&](const QString &line) -> bool {
        if (!handleCommand(line, console, lastImage)) {
            QCoreApplication::quit();
            return false;
        }
        return true;
    };
    QObject::connect(&stdinNotifier, &QSocketNotifier::activated, &app, [&]() {
        char chunk[4096];
        const ssize_t count = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (count < 0 && errno == EINTR) {
            return;
        }
        if (count <= 0) {
            // End of input: keep streaming until the frame limit or a signal.
            stdinNotifier.setEnabled(false);
            const QString last = commandBuffer.takeRemainder();
            if (!last.isEmpty()) {
                runCommand(last);
            }
            printNewLines();
            return;
        }
        const QStringList lines = commandBuffer.append(QByteArray(chunk, static_cast<int>(count)));
        for (const QString &line : lines) {
            if (!runCommand(line)) {
                break;
            }
        }
        printNewLines();
    });

    const int code = app.exec();
    printNewLines();
    return code;
}
