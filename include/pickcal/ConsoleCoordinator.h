#pragma once

#include <QImage>
#include <QString>

#include <chrono>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "pickcal/Actuator.h"
#include "pickcal/CalibrationSession.h"
#include "pickcal/ConsoleConfig.h"
#include "pickcal/FramePump.h"
#include "pickcal/OperationResult.h"
#include "pickcal/StatusLog.h"
#include "pickcal/TargetDetector.h"
#include "pickcal/camera/CameraSourceManager.h"

namespace pickcal {

struct SelectCommand {
    int source {0};
};

struct PowerCommand {
    int source {0};
    bool on {false};
};

struct CalibrationStepCommand {
    CalibrationRequest request;
};

struct ResetCommand {
};

// Everything the operator panel can ask for.
using Command = std::variant<SelectCommand, PowerCommand, CalibrationStepCommand, ResetCommand>;

// Replaceable collaborators; empty members get the production defaults.
struct ConsoleCollaborators {
    CameraSourceManager::DeviceFactory deviceFactory;
    std::unique_ptr<Actuator> actuator;
    std::unique_ptr<TargetDetector> detector;
};

/**
 * Wires the camera slots, the frame pump, the calibration session and the
 * status log behind the console's two inbound entry points: the viewport's
 * per-tick renderImage() and the calibrate button's calibrationStep().
 *
 * The coordinator installs its StatusLog as the Logger sink for its lifetime.
 */
class ConsoleCoordinator {
public:
    explicit ConsoleCoordinator(const ConsoleConfig &config,
                                ConsoleCollaborators collaborators = ConsoleCollaborators());
    ~ConsoleCoordinator();

    ConsoleCoordinator(const ConsoleCoordinator &) = delete;
    ConsoleCoordinator &operator=(const ConsoleCoordinator &) = delete;

    QImage renderImage(qint64 frameIndex);

    // Returns as soon as the step is queued; the outcome shows up in the
    // status log and calibrationStatus().
    OperationResult calibrationStep(int targetId, int gridRows, int gridCols, const QString &locX, const QString &locY);

    OperationResult submit(const Command &command);

    StatusLog &statusLog() { return m_statusLog; }
    const StatusLog &statusLog() const { return m_statusLog; }
    std::vector<CameraSlotInfo> cameraSlots() const { return m_cameras.slots(); }
    int activeSource() const { return m_cameras.activeSource(); }
    SessionStatus calibrationStatus() const { return m_session.status(); }
    std::optional<CalibrationResult> lastCalibrationResult() const { return m_session.lastResult(); }
    std::vector<CapturedPoint> capturedPoints() const { return m_session.capturedPoints(); }

    const ConsoleConfig &config() const { return m_config; }
    const FramePump &framePump() const { return m_pump; }

    bool waitForCalibrationIdle(std::chrono::milliseconds timeout) { return m_session.waitForIdleWorker(timeout); }

private:
    // Routes Logger output into m_statusLog while the coordinator is alive.
    class LogSinkInstaller {
    public:
        explicit LogSinkInstaller(StatusLog &log);
        ~LogSinkInstaller();
    };

    const ConsoleConfig m_config;
    StatusLog m_statusLog;
    LogSinkInstaller m_sinkInstaller;
    std::unique_ptr<Actuator> m_actuator;
    std::unique_ptr<TargetDetector> m_detector;
    CameraSourceManager m_cameras;
    FramePump m_pump;
    CalibrationSession m_session;
};

} // namespace pickcal
