#pragma once

#include <QString>
#include <QtGlobal>

#include <array>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "pickcal/OperationResult.h"
#include "pickcal/camera/CameraDevice.h"

namespace pickcal {

struct CameraSlotConfig {
    QString name;
    QString backend {QStringLiteral("none")};
    QString device;
    bool powered {false};
};

struct CameraSlotInfo {
    int id {-1};
    QString name;
    QString backend;
    bool powered {false};
    bool open {false};
    bool active {false};
    quint64 framesCaptured {0};
};

// Creates the device for a slot's configured backend; null with a message
// when the backend is unknown or unavailable in this build.
CameraDevicePtr createCameraDevice(const CameraSlotConfig &config, QString *errorMessage);

/**
 * Single owner of the console's three camera slots. Only this class opens,
 * closes or reads a device. Reads on one slot are serialized; a capture that
 * cannot get the slot within its timeout falls back to the cached frame.
 *
 * Lock order: a slot's I/O mutex is always taken before m_stateMutex.
 */
class CameraSourceManager {
public:
    static constexpr int kSlotCount = 3;

    using SlotConfigs = std::array<CameraSlotConfig, kSlotCount>;
    using DeviceFactory = std::function<CameraDevicePtr(int slot, const CameraSlotConfig &, QString *errorMessage)>;

    explicit CameraSourceManager(const SlotConfigs &configs, DeviceFactory factory = DeviceFactory());
    ~CameraSourceManager();

    CameraSourceManager(const CameraSourceManager &) = delete;
    CameraSourceManager &operator=(const CameraSourceManager &) = delete;

    OperationResult select(int sourceId);
    OperationResult setPower(int sourceId, bool on);

    // With allowCached=false a busy slot yields ErrorCode::Busy instead of
    // the last delivered frame.
    FrameResult captureFrame(std::chrono::milliseconds timeout, bool allowCached = true);

    int activeSource() const;
    std::optional<CameraSlotInfo> slotInfo(int sourceId) const;
    std::vector<CameraSlotInfo> slots() const;

    // Closes every device. Called by the destructor.
    void shutdown();

    static bool isValidSource(int sourceId) { return sourceId >= 0 && sourceId < kSlotCount; }

private:
    struct Slot {
        CameraSlotConfig config;
        std::timed_mutex ioMutex;
        CameraDevicePtr device; // guarded by ioMutex
        bool powered {false};
        bool deviceOpen {false};
        Frame lastFrame;
        quint64 framesCaptured {0};
        bool faultReported {false};
    };

    QString slotLabel(int sourceId) const;
    OperationResult openDevice(int sourceId);
    void closeDevice(int sourceId);
    void reportReadFault(int sourceId, const QString &message);

    std::array<std::unique_ptr<Slot>, kSlotCount> m_slots;
    DeviceFactory m_factory;

    std::mutex m_controlMutex; // select/setPower/shutdown
    mutable std::mutex m_stateMutex;
    int m_active {-1};
    quint64 m_nextSequence {1};
};

} // namespace pickcal
