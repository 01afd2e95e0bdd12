#pragma once

#include <QString>

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "pickcal/camera/CameraDevice.h"

namespace pickcal {

/**
 * cv::VideoCapture backend. `device` is either a numeric index ("0") or a
 * URI / file path understood by the OpenCV video backends.
 *
 * A grab thread owns the capture while the device is open and publishes the
 * newest frame; read() only waits for that hand-off, so it never blocks
 * longer than its timeout whatever the backend does. File and stream
 * sources are paced at their reported frame rate.
 */
class OpenCvCameraDevice : public CameraDevice {
public:
    explicit OpenCvCameraDevice(const QString &device);
    ~OpenCvCameraDevice() override;

    QString backendName() const override { return QStringLiteral("opencv"); }
    QString describe() const override;

    bool open(QString *errorMessage) override;
    void close() override;
    bool isOpen() const override;
    bool read(cv::Mat &frame, std::chrono::milliseconds timeout, QString *errorMessage) override;

private:
    void grabLoop(std::chrono::microseconds framePeriod);

    QString m_device;
    cv::VideoCapture m_capture;
    std::thread m_grabThread;

    mutable std::mutex m_frameMutex;
    std::condition_variable m_frameReady;
    cv::Mat m_latest;
    std::uint64_t m_latestCounter {0};
    std::uint64_t m_deliveredCounter {0};
    QString m_lastGrabError;
    bool m_running {false};
};

} // namespace pickcal
