#include "pickcal/camera/CameraSourceManager.h"

#include <QDateTime>

#include <algorithm>
#include <exception>
#include <utility>

#include <opencv2/core.hpp>

#include "pickcal/Logger.h"
#include "pickcal/camera/OpenCvCameraDevice.h"
#ifdef PICKCAL_HAVE_VIMBA
#include "pickcal/camera/VimbaCameraDevice.h"
#endif

namespace pickcal {

CameraDevicePtr createCameraDevice(const CameraSlotConfig &config, QString *errorMessage)
{
    const QString backend = config.backend.trimmed().toLower();
    if (backend == QLatin1String("opencv")) {
        return std::make_unique<OpenCvCameraDevice>(config.device);
    }
    if (backend == QLatin1String("vimba")) {
#ifdef PICKCAL_HAVE_VIMBA
        return std::make_unique<VimbaCameraDevice>(config.device);
#else
        if (errorMessage) {
            *errorMessage = QStringLiteral("this build has no Vimba X support");
        }
        return nullptr;
#endif
    }
    if (errorMessage) {
        *errorMessage = backend == QLatin1String("none")
                            ? QStringLiteral("no camera hardware is configured for this slot")
                            : QStringLiteral("unknown camera backend \"%1\"").arg(config.backend);
    }
    return nullptr;
}

CameraSourceManager::CameraSourceManager(const SlotConfigs &configs, DeviceFactory factory)
    : m_factory(std::move(factory))
{
    for (int i = 0; i < kSlotCount; ++i) {
        m_slots[i] = std::make_unique<Slot>();
        m_slots[i]->config = configs[i];
        m_slots[i]->powered = configs[i].powered;
    }
}

CameraSourceManager::~CameraSourceManager()
{
    shutdown();
}

QString CameraSourceManager::slotLabel(int sourceId) const
{
    const QString &name = m_slots[sourceId]->config.name;
    if (name.isEmpty()) {
        return QStringLiteral("Camera %1").arg(sourceId);
    }
    return QStringLiteral("Camera %1 (%2)").arg(sourceId).arg(name);
}

OperationResult CameraSourceManager::select(int sourceId)
{
    std::lock_guard<std::mutex> control(m_controlMutex);
    if (!isValidSource(sourceId)) {
        const QString message = QStringLiteral("Camera source %1 does not exist (valid sources: 0-%2)")
                                    .arg(sourceId)
                                    .arg(kSlotCount - 1);
        Logger::warning(message);
        return OperationResult::failure(ErrorCode::InvalidSource, message);
    }

    int previous = -1;
    bool powered = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        previous = m_active;
        powered = m_slots[sourceId]->powered;
    }

    if (previous >= 0 && previous != sourceId) {
        closeDevice(previous);
        Logger::info(QStringLiteral("%1 deactivated").arg(slotLabel(previous)));
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_active = sourceId;
    }

    if (!powered) {
        const QString message = QStringLiteral("%1 selected; it is powered off, no signal until powered on")
                                    .arg(slotLabel(sourceId));
        Logger::info(message);
        return OperationResult::ok(message);
    }

    const OperationResult opened = openDevice(sourceId);
    if (!opened.success) {
        Logger::error(QStringLiteral("%1 selected but could not be opened: %2").arg(slotLabel(sourceId), opened.message));
        return opened;
    }

    const QString message = QStringLiteral("%1 selected").arg(slotLabel(sourceId));
    Logger::info(message);
    return OperationResult::ok(message);
}

OperationResult CameraSourceManager::setPower(int sourceId, bool on)
{
    std::lock_guard<std::mutex> control(m_controlMutex);
    if (!isValidSource(sourceId)) {
        const QString message = QStringLiteral("Cannot switch power of camera source %1: no such source").arg(sourceId);
        Logger::warning(message);
        return OperationResult::failure(ErrorCode::InvalidSource, message);
    }

    bool current = false;
    bool isActive = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        current = m_slots[sourceId]->powered;
        isActive = m_active == sourceId;
    }

    const QString stateText = on ? QStringLiteral("on") : QStringLiteral("off");
    if (current == on) {
        const QString message = QStringLiteral("%1 is already powered %2").arg(slotLabel(sourceId), stateText);
        Logger::info(message);
        return OperationResult::ok(message);
    }

    if (!on) {
        // Flip the flag first so new captures bail out before waiting on the device.
        {
            std::lock_guard<std::mutex> lock(m_stateMutex);
            m_slots[sourceId]->powered = false;
        }
        closeDevice(sourceId);
        const QString message = QStringLiteral("%1 powered off, device released").arg(slotLabel(sourceId));
        Logger::info(message);
        return OperationResult::ok(message);
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_slots[sourceId]->powered = true;
    }

    if (isActive) {
        const OperationResult opened = openDevice(sourceId);
        if (!opened.success) {
            Logger::error(QStringLiteral("%1 powered on but could not be opened: %2").arg(slotLabel(sourceId), opened.message));
            return opened;
        }
    }

    const QString message = QStringLiteral("%1 powered on").arg(slotLabel(sourceId));
    Logger::info(message);
    return OperationResult::ok(message);
}

FrameResult CameraSourceManager::captureFrame(std::chrono::milliseconds timeout, bool allowCached)
{
    FrameResult result;
    result.error = ErrorCode::NoSignal;

    int sourceId = -1;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        sourceId = m_active;
        if (sourceId < 0) {
            result.message = QStringLiteral("No camera source selected");
            return result;
        }
        if (!m_slots[sourceId]->powered) {
            result.message = QStringLiteral("%1 is powered off").arg(slotLabel(sourceId));
            return result;
        }
    }

    // Lock wait and device read share one budget.
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    Slot &slot = *m_slots[sourceId];
    std::unique_lock<std::timed_mutex> io(slot.ioMutex, std::defer_lock);
    if (!io.try_lock_until(deadline)) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (allowCached && slot.lastFrame.isValid()) {
            result.success = true;
            result.error = ErrorCode::None;
            result.cached = true;
            result.frame = slot.lastFrame;
            return result;
        }
        result.error = allowCached ? ErrorCode::NoSignal : ErrorCode::Busy;
        result.message = QStringLiteral("%1 is busy with another capture").arg(slotLabel(sourceId));
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (!slot.powered || m_active != sourceId) {
            result.message = QStringLiteral("%1 was switched off during the capture").arg(slotLabel(sourceId));
            return result;
        }
    }

    if (!slot.device || !slot.device->isOpen()) {
        result.message = QStringLiteral("%1 is not connected").arg(slotLabel(sourceId));
        return result;
    }

    const auto remaining = std::max(std::chrono::milliseconds(1),
                                    std::chrono::duration_cast<std::chrono::milliseconds>(
                                        deadline - std::chrono::steady_clock::now()));
    cv::Mat image;
    QString error;
    bool ok = false;
    try {
        ok = slot.device->read(image, remaining, &error);
    } catch (const cv::Exception &ex) {
        error = QString::fromStdString(ex.what());
    } catch (const std::exception &ex) {
        error = QString::fromLocal8Bit(ex.what());
    }

    if (!ok || image.empty()) {
        if (error.isEmpty()) {
            error = QStringLiteral("empty frame");
        }
        reportReadFault(sourceId, error);
        result.error = ErrorCode::DeviceFault;
        result.message = QStringLiteral("%1 read failed: %2").arg(slotLabel(sourceId), error);
        return result;
    }

    bool recovered = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        Frame frame;
        frame.image = image;
        frame.sequence = m_nextSequence++;
        frame.sourceId = sourceId;
        frame.capturedAt = QDateTime::currentDateTime();
        slot.lastFrame = frame;
        ++slot.framesCaptured;
        recovered = slot.faultReported;
        slot.faultReported = false;

        result.success = true;
        result.error = ErrorCode::None;
        result.frame = frame;
    }
    if (recovered) {
        Logger::info(QStringLiteral("%1 is delivering frames again").arg(slotLabel(sourceId)));
    }
    return result;
}

void CameraSourceManager::reportReadFault(int sourceId, const QString &message)
{
    bool firstInStreak = false;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        firstInStreak = !m_slots[sourceId]->faultReported;
        m_slots[sourceId]->faultReported = true;
    }
    if (firstInStreak) {
        Logger::error(QStringLiteral("%1 read failed: %2").arg(slotLabel(sourceId), message));
    }
}

int CameraSourceManager::activeSource() const
{
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_active;
}

std::optional<CameraSlotInfo> CameraSourceManager::slotInfo(int sourceId) const
{
    if (!isValidSource(sourceId)) {
        return std::nullopt;
    }

    const Slot &slot = *m_slots[sourceId];
    CameraSlotInfo info;
    info.id = sourceId;
    info.name = slot.config.name;
    info.backend = slot.config.backend;

    std::lock_guard<std::mutex> lock(m_stateMutex);
    info.powered = slot.powered;
    info.active = m_active == sourceId;
    info.framesCaptured = slot.framesCaptured;
    info.open = slot.deviceOpen;
    return info;
}

std::vector<CameraSlotInfo> CameraSourceManager::slots() const
{
    std::vector<CameraSlotInfo> out;
    out.reserve(kSlotCount);
    for (int i = 0; i < kSlotCount; ++i) {
        if (auto info = slotInfo(i)) {
            out.push_back(*info);
        }
    }
    return out;
}

void CameraSourceManager::shutdown()
{
    std::lock_guard<std::mutex> control(m_controlMutex);
    for (int i = 0; i < kSlotCount; ++i) {
        closeDevice(i);
    }
}

OperationResult CameraSourceManager::openDevice(int sourceId)
{
    Slot &slot = *m_slots[sourceId];
    std::lock_guard<std::timed_mutex> io(slot.ioMutex);

    if (!slot.device) {
        QString error;
        try {
            slot.device = m_factory ? m_factory(sourceId, slot.config, &error)
                                    : createCameraDevice(slot.config, &error);
        } catch (const std::exception &ex) {
            error = QString::fromLocal8Bit(ex.what());
        }
        if (!slot.device) {
            return OperationResult::failure(ErrorCode::DeviceFault,
                                            QStringLiteral("no device for %1: %2").arg(slotLabel(sourceId), error));
        }
    }

    if (slot.device->isOpen()) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        slot.deviceOpen = true;
        return OperationResult::ok();
    }

    QString error;
    bool opened = false;
    try {
        opened = slot.device->open(&error);
    } catch (const cv::Exception &ex) {
        error = QString::fromStdString(ex.what());
    } catch (const std::exception &ex) {
        error = QString::fromLocal8Bit(ex.what());
    }

    if (!opened) {
        slot.device.reset();
        return OperationResult::failure(ErrorCode::DeviceFault,
                                        error.isEmpty() ? QStringLiteral("open failed") : error);
    }

    Logger::info(QStringLiteral("%1 opened %2").arg(slotLabel(sourceId), slot.device->describe()));
    std::lock_guard<std::mutex> lock(m_stateMutex);
    slot.deviceOpen = true;
    slot.faultReported = false;
    return OperationResult::ok();
}

void CameraSourceManager::closeDevice(int sourceId)
{
    Slot &slot = *m_slots[sourceId];
    {
        // Waits for an in-flight read; devices are never closed mid-read.
        std::lock_guard<std::timed_mutex> io(slot.ioMutex);
        if (slot.device) {
            try {
                slot.device->close();
            } catch (const std::exception &ex) {
                Logger::warning(QStringLiteral("Closing %1 raised: %2")
                                    .arg(slotLabel(sourceId), QString::fromLocal8Bit(ex.what())));
            }
            slot.device.reset();
        }
    }

    std::lock_guard<std::mutex> lock(m_stateMutex);
    slot.deviceOpen = false;
    slot.lastFrame = Frame();
    slot.faultReported = false;
}

} // namespace pickcal
