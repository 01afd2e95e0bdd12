#include "pickcal/camera/VimbaCameraDevice.h"

#include <QLocale>

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <string>

#include "pickcal/Logger.h"

using namespace VmbCPP;

namespace pickcal {

namespace {

// VmbSystem is a process singleton; several slots may share it.
std::mutex g_systemMutex;
int g_systemUsers = 0;

QString errorToQString(VmbErrorType err) {
    return QStringLiteral("Vimba error (%1)").arg(static_cast<int>(err));
}

QString pixelFormatDisplayName(VmbPixelFormatType format) {
    switch (format) {
    case VmbPixelFormatMono8:
        return QStringLiteral("Mono8");
    case VmbPixelFormatMono16:
        return QStringLiteral("Mono16");
    case VmbPixelFormatRgb8:
        return QStringLiteral("RGB8");
    case VmbPixelFormatBgr8:
        return QStringLiteral("BGR8");
    case VmbPixelFormatBayerRG8:
        return QStringLiteral("BayerRG8");
    case VmbPixelFormatBayerBG8:
        return QStringLiteral("BayerBG8");
    case VmbPixelFormatBayerGR8:
        return QStringLiteral("BayerGR8");
    case VmbPixelFormatBayerGB8:
        return QStringLiteral("BayerGB8");
    default:
        return QStringLiteral("0x%1").arg(QString::number(static_cast<qulonglong>(format), 16).toUpper());
    }
}

int expectedBytesPerPixel(VmbPixelFormatType format) {
    switch (format) {
    case VmbPixelFormatMono8:
    case VmbPixelFormatBayerRG8:
    case VmbPixelFormatBayerBG8:
    case VmbPixelFormatBayerGR8:
    case VmbPixelFormatBayerGB8:
        return 1;
    case VmbPixelFormatRgb8:
    case VmbPixelFormatBgr8:
        return 3;
    case VmbPixelFormatMono16:
        return 2;
    default:
        return 0;
    }
}

int computeStride(int width, int height, int bufferSize, VmbPixelFormatType format) {
    const int bytesPerPixel = expectedBytesPerPixel(format);
    if (bytesPerPixel <= 0) {
        return 0;
    }
    const int baseline = width * bytesPerPixel;
    if (height <= 0 || bufferSize <= 0) {
        return baseline;
    }
    const int derived = bufferSize / std::max(1, height);
    return derived >= baseline ? derived : baseline;
}

// Converts a completed Vimba buffer into an owned 8-bit BGR or gray matrix.
cv::Mat convertFrameToMat(int width,
                          int height,
                          VmbPixelFormatType format,
                          const VmbUchar_t* data,
                          int bufferSize,
                          QString* errorMessage) {
    if (errorMessage) {
        errorMessage->clear();
    }
    if (!data || width <= 0 || height <= 0) {
        return {};
    }

    const int stride = computeStride(width, height, bufferSize, format);
    auto* raw = const_cast<VmbUchar_t*>(data);
    switch (format) {
    case VmbPixelFormatMono8:
        return cv::Mat(height, width, CV_8UC1, raw, static_cast<size_t>(stride)).clone();
    case VmbPixelFormatBgr8:
        return cv::Mat(height, width, CV_8UC3, raw, static_cast<size_t>(stride)).clone();
    case VmbPixelFormatRgb8: {
        cv::Mat bgr;
        cv::cvtColor(cv::Mat(height, width, CV_8UC3, raw, static_cast<size_t>(stride)), bgr, cv::COLOR_RGB2BGR);
        return bgr;
    }
    case VmbPixelFormatMono16: {
        cv::Mat normalized;
        cv::Mat(height, width, CV_16UC1, raw, static_cast<size_t>(stride)).convertTo(normalized, CV_8U, 1.0 / 256.0);
        return normalized;
    }
    case VmbPixelFormatBayerRG8:
    case VmbPixelFormatBayerBG8:
    case VmbPixelFormatBayerGR8:
    case VmbPixelFormatBayerGB8: {
        int code = cv::COLOR_BayerRG2BGR;
        if (format == VmbPixelFormatBayerBG8) {
            code = cv::COLOR_BayerBG2BGR;
        } else if (format == VmbPixelFormatBayerGR8) {
            code = cv::COLOR_BayerGR2BGR;
        } else if (format == VmbPixelFormatBayerGB8) {
            code = cv::COLOR_BayerGB2BGR;
        }
        cv::Mat bgr;
        cv::cvtColor(cv::Mat(height, width, CV_8UC1, raw, static_cast<size_t>(stride)), bgr, code);
        return bgr;
    }
    default:
        break;
    }

    if (errorMessage) {
        *errorMessage = QStringLiteral("Pixel format %1 is not supported; switch PixelFormat to Mono8 or BayerRG8")
                            .arg(pixelFormatDisplayName(format));
    }
    return {};
}

class DeviceFrameObserver : public IFrameObserver {
public:
    DeviceFrameObserver(const CameraPtr& cam, VimbaCameraDevice* device)
        : IFrameObserver(cam)
        , m_device(device) {}

    void FrameReceived(const FramePtr frame) override {
        if (m_device) {
            m_device->processFrame(frame);
        }
    }

private:
    VimbaCameraDevice* m_device {nullptr};
};

CameraPtr cameraById(const CameraPtrVector& cameras, const QString& id) {
    for (const auto& cam : cameras) {
        if (!cam) {
            continue;
        }
        std::string rawId;
        cam->GetID(rawId);
        if (QString::fromLocal8Bit(rawId.c_str()).compare(id, Qt::CaseInsensitive) == 0) {
            return cam;
        }
    }
    return CameraPtr();
}

FeaturePtr featureByName(const CameraPtr& cam, const char* name) {
    FeaturePtr f;
    if (cam && name) {
        cam->GetFeatureByName(name, f);
    }
    return f;
}

} // namespace


VimbaCameraDevice::VimbaCameraDevice(const QString& idOrIndex)
    : m_idOrIndex(idOrIndex.trimmed())
    , m_sys(VmbSystem::GetInstance()) {
}


VimbaCameraDevice::~VimbaCameraDevice() {
    close();
}


QString VimbaCameraDevice::describe() const {
    if (m_model.isEmpty()) {
        return QStringLiteral("Vimba camera \"%1\"").arg(m_idOrIndex);
    }
    return QStringLiteral("Vimba camera \"%1\" (%2)").arg(m_idOrIndex, m_model);
}


bool VimbaCameraDevice::open(QString* errorMessage) {
    if (m_cam) {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(g_systemMutex);
        if (g_systemUsers == 0) {
            const VmbErrorType err = m_sys.Startup();
            if (err != VmbErrorSuccess) {
                if (errorMessage) {
                    *errorMessage = QStringLiteral("Vimba startup failed: %1").arg(errorToQString(err));
                }
                return false;
            }
        }
        ++g_systemUsers;
        m_systemStarted = true;
    }

    CameraPtrVector cameras;
    if (m_sys.GetCameras(cameras) != VmbErrorSuccess) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unable to enumerate Vimba cameras");
        }
        close();
        return false;
    }

    CameraPtr candidate;
    bool okIndex = false;
    const int index = QLocale::c().toInt(m_idOrIndex, &okIndex);
    if (okIndex && index >= 0 && index < static_cast<int>(cameras.size())) {
        candidate = cameras[static_cast<size_t>(index)];
    }
    if (!candidate) {
        candidate = cameraById(cameras, m_idOrIndex);
    }

    VmbErrorType err = VmbErrorNotFound;
    if (candidate) {
        err = candidate->Open(VmbAccessModeFull);
        if (err == VmbErrorSuccess) {
            m_cam = candidate;
        }
    } else {
        CameraPtr opened;
        err = m_sys.OpenCameraByID(m_idOrIndex.toLocal8Bit().constData(), VmbAccessModeFull, opened);
        if (err == VmbErrorSuccess) {
            m_cam = opened;
        }
    }

    if (err != VmbErrorSuccess || !m_cam) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to open Vimba camera \"%1\": %2").arg(m_idOrIndex, errorToQString(err));
        }
        m_cam.reset();
        close();
        return false;
    }

    std::string model;
    m_cam->GetModel(model);
    m_model = QString::fromLocal8Bit(model.c_str());
    m_observer = IFrameObserverPtr(new DeviceFrameObserver(m_cam, this));

    if (!startStreaming(errorMessage)) {
        close();
        return false;
    }
    Logger::info(QStringLiteral("Opened %1").arg(describe()));
    return true;
}


void VimbaCameraDevice::close() {
    if (m_cam) {
        stopStreaming();
        m_observer.reset();
        const VmbErrorType err = m_cam->Close();
        if (err != VmbErrorSuccess) {
            Logger::warning(QStringLiteral("Closing %1 returned %2").arg(describe(), errorToQString(err)));
        }
        m_cam.reset();
    }

    if (m_systemStarted) {
        std::lock_guard<std::mutex> lock(g_systemMutex);
        m_systemStarted = false;
        if (--g_systemUsers == 0) {
            const VmbErrorType err = m_sys.Shutdown();
            if (err != VmbErrorSuccess) {
                Logger::warning(QStringLiteral("Vimba shutdown returned %1").arg(static_cast<int>(err)));
            }
        }
    }
}


bool VimbaCameraDevice::isOpen() const {
    return static_cast<bool>(m_cam);
}


bool VimbaCameraDevice::startStreaming(QString* errorMessage) {
    auto fail = [errorMessage](const QString& message) {
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    };

    m_frames.clear();

    if (FeaturePtr autoNegotiate = featureByName(m_cam, "StreamAutoNegotiatePacketSize")) {
        bool writable = false;
        autoNegotiate->IsWritable(writable);
        if (writable) {
            bool enabled = false;
            if (autoNegotiate->GetValue(enabled) != VmbErrorSuccess || !enabled) {
                autoNegotiate->SetValue(true);
            }
        }
    }
    if (FeaturePtr adjustPacket = featureByName(m_cam, "GVSPAdjustPacketSize")) {
        adjustPacket->RunCommand();
    }

    const int kNumBuffers = 12;
    VmbUint32_t payload = 0;
    if (m_cam->GetPayloadSize(payload) != VmbErrorSuccess || payload == 0) {
        if (FeaturePtr payloadFeature = featureByName(m_cam, "PayloadSize")) {
            VmbInt64_t payloadValue = 0;
            if (payloadFeature->GetValue(payloadValue) == VmbErrorSuccess && payloadValue > 0) {
                payload = static_cast<VmbUint32_t>(payloadValue);
            }
        }
    }
    if (payload == 0) {
        payload = 4 * 1024 * 1024;
    }

    for (int i = 0; i < kNumBuffers; ++i) {
        FramePtr frame(new VmbCPP::Frame(static_cast<VmbInt64_t>(payload)));
        const VmbErrorType obsErr = frame->RegisterObserver(m_observer);
        if (obsErr != VmbErrorSuccess) {
            return fail(QStringLiteral("RegisterObserver failed: %1").arg(errorToQString(obsErr)));
        }
        const VmbErrorType announceErr = m_cam->AnnounceFrame(frame);
        if (announceErr != VmbErrorSuccess) {
            return fail(QStringLiteral("AnnounceFrame failed: %1").arg(errorToQString(announceErr)));
        }
        m_frames.push_back(frame);
    }

    const VmbErrorType err = m_cam->StartCapture();
    if (err != VmbErrorSuccess) {
        return fail(QStringLiteral("StartCapture failed: %1").arg(errorToQString(err)));
    }

    {
        std::lock_guard<std::mutex> lock(m_frameMutex);
        m_running = true;
        m_latest.release();
        m_latestCounter = 0;
        m_deliveredCounter = 0;
    }

    for (auto& frame : m_frames) {
        const VmbErrorType queueErr = m_cam->QueueFrame(frame);
        if (queueErr != VmbErrorSuccess) {
            Logger::warning(QStringLiteral("QueueFrame failed: %1").arg(errorToQString(queueErr)));
        }
    }

    if (FeaturePtr startAcq = featureByName(m_cam, "AcquisitionStart")) {
        startAcq->RunCommand();
    }
    return true;
}


void VimbaCameraDevice::stopStreaming() {
    {
        std::lock_guard<std::mutex> lock(m_frameMutex);
        if (!m_running) {
            return;
        }
        m_running = false;
    }
    m_frameReady.notify_all();

    if (FeaturePtr stopAcq = featureByName(m_cam, "AcquisitionStop")) {
        stopAcq->RunCommand();
    }
    m_cam->EndCapture();
    m_cam->FlushQueue();
    m_cam->RevokeAllFrames();
    for (auto& frame : m_frames) {
        if (frame) {
            frame->UnregisterObserver();
        }
    }
    m_frames.clear();
}


bool VimbaCameraDevice::read(cv::Mat& frame, std::chrono::milliseconds timeout, QString* errorMessage) {
    std::unique_lock<std::mutex> lock(m_frameMutex);
    const bool ready = m_frameReady.wait_for(lock, timeout, [this]() {
        return !m_running || m_latestCounter > m_deliveredCounter;
    });
    if (!m_running) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1 is not streaming").arg(describe());
        }
        return false;
    }
    if (!ready || m_latest.empty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("%1: no frame within %2 ms").arg(describe()).arg(timeout.count());
        }
        return false;
    }
    frame = m_latest;
    m_deliveredCounter = m_latestCounter;
    return true;
}


void VimbaCameraDevice::processFrame(const FramePtr& frame) {
    if (!frame) {
        return;
    }

    VmbFrameStatusType status = VmbFrameStatusInvalid;
    frame->GetReceiveStatus(status);

    if (status == VmbFrameStatusComplete) {
        VmbUint32_t w = 0;
        VmbUint32_t h = 0;
        frame->GetWidth(w);
        frame->GetHeight(h);

        VmbPixelFormatType pf = VmbPixelFormatMono8;
        frame->GetPixelFormat(pf);

        VmbUint32_t size = 0;
        frame->GetBufferSize(size);
        const VmbUchar_t* data = nullptr;
        frame->GetImage(data);

        if (data != nullptr && w > 0 && h > 0) {
            QString conversionError;
            cv::Mat image;
            try {
                image = convertFrameToMat(static_cast<int>(w), static_cast<int>(h), pf, data, static_cast<int>(size), &conversionError);
            } catch (const cv::Exception& ex) {
                conversionError = QString::fromStdString(ex.what());
            }

            std::lock_guard<std::mutex> lock(m_frameMutex);
            if (!image.empty()) {
                m_latest = image;
                ++m_latestCounter;
                m_lastUnsupportedPixelFormat.reset();
            } else if (!conversionError.isEmpty()) {
                if (!m_lastUnsupportedPixelFormat.has_value() || m_lastUnsupportedPixelFormat.value() != pf) {
                    m_lastUnsupportedPixelFormat = pf;
                    Logger::warning(conversionError);
                }
            }
        }
        m_frameReady.notify_all();
    }

    bool running = false;
    {
        std::lock_guard<std::mutex> lock(m_frameMutex);
        running = m_running;
    }
    if (running && m_cam) {
        m_cam->QueueFrame(frame);
    }
}

} // namespace pickcal
