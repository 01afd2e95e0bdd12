#include "pickcal/camera/OpenCvCameraDevice.h"

#include <QLocale>

#include <utility>

#include "pickcal/Logger.h"

namespace pickcal {

namespace {

// Back-off after a failed grab so a dead source does not spin the thread.
constexpr std::chrono::milliseconds kGrabRetryDelay {20};

} // namespace

OpenCvCameraDevice::OpenCvCameraDevice(const QString &device)
    : m_device(device.trimmed())
{
}

OpenCvCameraDevice::~OpenCvCameraDevice()
{
    close();
}

QString OpenCvCameraDevice::describe() const
{
    return QStringLiteral("OpenCV capture \"%1\"").arg(m_device);
}

bool OpenCvCameraDevice::open(QString *errorMessage)
{
    if (isOpen()) {
        return true;
    }

    bool okIndex = false;
    const int index = QLocale::c().toInt(m_device, &okIndex);
    try {
        const bool opened = okIndex ? m_capture.open(index, cv::CAP_ANY)
                                    : m_capture.open(m_device.toStdString(), cv::CAP_ANY);
        if (!opened || !m_capture.isOpened()) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Unable to open camera \"%1\"").arg(m_device);
            }
            return false;
        }
    } catch (const cv::Exception &ex) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("OpenCV error opening \"%1\": %2")
                                .arg(m_device, QString::fromStdString(ex.what()));
        }
        return false;
    }

    const int width = static_cast<int>(m_capture.get(cv::CAP_PROP_FRAME_WIDTH));
    const int height = static_cast<int>(m_capture.get(cv::CAP_PROP_FRAME_HEIGHT));
    const double fps = m_capture.get(cv::CAP_PROP_FPS);
    Logger::info(QStringLiteral("Camera \"%1\": width %2, height %3, FPS %4 (backend %5)")
                     .arg(m_device)
                     .arg(width)
                     .arg(height)
                     .arg(fps, 0, 'f', 1)
                     .arg(QString::fromStdString(m_capture.getBackendName())));

    // Live devices pace themselves; files would otherwise be drained at decode speed.
    std::chrono::microseconds framePeriod {0};
    if (!okIndex && fps > 0.0) {
        framePeriod = std::chrono::microseconds(static_cast<long long>(1e6 / fps));
    }

    {
        std::lock_guard<std::mutex> lock(m_frameMutex);
        m_latest.release();
        m_latestCounter = 0;
        m_deliveredCounter = 0;
        m_lastGrabError.clear();
        m_running = true;
    }
    m_grabThread = std::thread(&OpenCvCameraDevice::grabLoop, this, framePeriod);
    return true;
}

void OpenCvCameraDevice::close()
{
    {
        std::lock_guard<std::mutex> lock(m_frameMutex);
        m_running = false;
    }
    m_frameReady.notify_all();

    // The grab thread finishes its current backend read before it sees the flag.
    if (m_grabThread.joinable()) {
        m_grabThread.join();
    }
    if (m_capture.isOpened()) {
        m_capture.release();
    }
}

bool OpenCvCameraDevice::isOpen() const
{
    std::lock_guard<std::mutex> lock(m_frameMutex);
    return m_running;
}

void OpenCvCameraDevice::grabLoop(std::chrono::microseconds framePeriod)
{
    auto nextGrab = std::chrono::steady_clock::now();
    while (true) {
        {
            std::lock_guard<std::mutex> lock(m_frameMutex);
            if (!m_running) {
                return;
            }
        }

        if (framePeriod.count() > 0) {
            std::this_thread::sleep_until(nextGrab);
            nextGrab += framePeriod;
        }

        cv::Mat image;
        QString error;
        try {
            if (!m_capture.read(image) || image.empty()) {
                error = QStringLiteral("Camera \"%1\" returned no frame").arg(m_device);
            }
        } catch (const cv::Exception &ex) {
            error = QStringLiteral("OpenCV error reading \"%1\": %2")
                        .arg(m_device, QString::fromStdString(ex.what()));
        }

        if (!error.isEmpty()) {
            {
                std::lock_guard<std::mutex> lock(m_frameMutex);
                m_lastGrabError = error;
            }
            std::this_thread::sleep_for(kGrabRetryDelay);
            nextGrab = std::chrono::steady_clock::now();
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(m_frameMutex);
            m_latest = std::move(image);
            ++m_latestCounter;
            m_lastGrabError.clear();
        }
        m_frameReady.notify_all();
    }
}

bool OpenCvCameraDevice::read(cv::Mat &frame, std::chrono::milliseconds timeout, QString *errorMessage)
{
    std::unique_lock<std::mutex> lock(m_frameMutex);
    const bool ready = m_frameReady.wait_for(lock, timeout, [this]() {
        return !m_running || m_latestCounter > m_deliveredCounter;
    });
    if (!m_running) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Camera \"%1\" is not open").arg(m_device);
        }
        return false;
    }
    if (!ready || m_latest.empty()) {
        if (errorMessage) {
            *errorMessage = m_lastGrabError.isEmpty()
                                ? QStringLiteral("Camera \"%1\": no frame within %2 ms").arg(m_device).arg(timeout.count())
                                : m_lastGrabError;
        }
        return false;
    }
    frame = m_latest.clone();
    m_deliveredCounter = m_latestCounter;
    return true;
}

} // namespace pickcal
