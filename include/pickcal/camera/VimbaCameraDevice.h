#pragma once

#include <QString>

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>

#include <opencv2/core.hpp>

// Vimba X C++ API
#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable:5054)
#endif
#include <VmbCPP/VmbCPP.h>
#ifdef _MSC_VER
#pragma warning(pop)
#endif

#include "pickcal/camera/CameraDevice.h"

namespace pickcal {

// Allied Vision camera streamed through Vimba X. Frames arrive on the SDK's
// callback thread; read() hands out the newest one not yet delivered.
class VimbaCameraDevice : public CameraDevice {
public:
    explicit VimbaCameraDevice(const QString& idOrIndex);
    ~VimbaCameraDevice() override;

    QString backendName() const override { return QStringLiteral("vimba"); }
    QString describe() const override;

    bool open(QString* errorMessage) override;
    void close() override;
    bool isOpen() const override;
    bool read(cv::Mat& frame, std::chrono::milliseconds timeout, QString* errorMessage) override;

    void processFrame(const VmbCPP::FramePtr& frame);

private:
    bool startStreaming(QString* errorMessage);
    void stopStreaming();

    QString m_idOrIndex;
    VmbCPP::VmbSystem& m_sys;
    bool m_systemStarted {false};
    VmbCPP::CameraPtr m_cam;
    VmbCPP::FramePtrVector m_frames;
    VmbCPP::IFrameObserverPtr m_observer;
    QString m_model;

    std::mutex m_frameMutex;
    std::condition_variable m_frameReady;
    cv::Mat m_latest;
    std::uint64_t m_latestCounter {0};
    std::uint64_t m_deliveredCounter {0};
    bool m_running {false};
    std::optional<VmbPixelFormatType> m_lastUnsupportedPixelFormat;
};

} // namespace pickcal
