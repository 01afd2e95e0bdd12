#include "pickcal/camera/OpenCvCameraDevice.h"
#include "gtest/gtest.h"

#include <QDir>
#include <QTemporaryDir>

#include <chrono>

#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

using namespace pickcal;
using namespace std::chrono_literals;

class OpenCvCameraDeviceTest : public ::testing::Test {
protected:
    QTemporaryDir dir;
    QString clipPath;

    // A short MJPG clip: the built-in AVI writer is present in every OpenCV build.
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        clipPath = QDir(dir.path()).filePath(QStringLiteral("clip.avi"));
        cv::VideoWriter writer(clipPath.toStdString(), cv::CAP_OPENCV_MJPEG, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'),
                               20.0, cv::Size(160, 120), true);
        ASSERT_TRUE(writer.isOpened());
        for (int i = 0; i < 4; ++i) {
            cv::Mat frame(120, 160, CV_8UC3, cv::Scalar(40 * i, 80, 160));
            cv::putText(frame, std::to_string(i), cv::Point(60, 80), cv::FONT_HERSHEY_SIMPLEX, 1.5, cv::Scalar(255, 255, 255), 2);
            writer.write(frame);
        }
        writer.release();
    }
};

TEST_F(OpenCvCameraDeviceTest, DeliversFramesFromGrabThread)
{
    OpenCvCameraDevice device(clipPath);
    QString error;
    ASSERT_TRUE(device.open(&error)) << error.toStdString();
    EXPECT_TRUE(device.isOpen());

    cv::Mat frame;
    ASSERT_TRUE(device.read(frame, 2000ms, &error)) << error.toStdString();
    EXPECT_EQ(frame.cols, 160);
    EXPECT_EQ(frame.rows, 120);

    device.close();
    EXPECT_FALSE(device.isOpen());
}

TEST_F(OpenCvCameraDeviceTest, ReadReturnsWithinTimeoutWhenSourceStalls)
{
    OpenCvCameraDevice device(clipPath);
    QString error;
    ASSERT_TRUE(device.open(&error)) << error.toStdString();

    // Past the end of the clip the source never produces another frame.
    bool stalled = false;
    for (int attempt = 0; attempt < 40 && !stalled; ++attempt) {
        cv::Mat frame;
        QString readError;
        const auto started = std::chrono::steady_clock::now();
        if (!device.read(frame, 150ms, &readError)) {
            const auto elapsed = std::chrono::steady_clock::now() - started;
            EXPECT_LT(elapsed, 1000ms);
            EXPECT_FALSE(readError.isEmpty());
            stalled = true;
        }
    }
    EXPECT_TRUE(stalled);
}

TEST_F(OpenCvCameraDeviceTest, ReadAfterCloseFailsImmediately)
{
    OpenCvCameraDevice device(clipPath);
    QString error;
    ASSERT_TRUE(device.open(&error)) << error.toStdString();
    device.close();

    cv::Mat frame;
    const auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(device.read(frame, 2000ms, &error));
    EXPECT_LT(std::chrono::steady_clock::now() - started, 500ms);
    EXPECT_TRUE(frame.empty());
}

TEST(OpenCvCameraDeviceOpenTest, MissingSourceReportsError)
{
    OpenCvCameraDevice device(QStringLiteral("/nonexistent/pickcal/clip.avi"));
    QString error;
    EXPECT_FALSE(device.open(&error));
    EXPECT_FALSE(error.isEmpty());
    EXPECT_FALSE(device.isOpen());
}
