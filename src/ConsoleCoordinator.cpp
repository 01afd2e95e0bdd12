#include "pickcal/ConsoleCoordinator.h"

#include <utility>

#include "pickcal/FrameRecorder.h"
#include "pickcal/Logger.h"

namespace pickcal {

namespace {

std::unique_ptr<Actuator> actuatorOrDefault(std::unique_ptr<Actuator> actuator)
{
    if (actuator) {
        return actuator;
    }
    return std::make_unique<ManualActuator>();
}

std::unique_ptr<TargetDetector> detectorOrDefault(std::unique_ptr<TargetDetector> detector, const TargetSpec &targets)
{
    if (detector) {
        return detector;
    }
    return std::make_unique<OpenCvTargetDetector>(targets);
}

} // namespace

ConsoleCoordinator::LogSinkInstaller::LogSinkInstaller(StatusLog &log)
{
    Logger::setSink([&log](QtMsgType level, const QString &message) { log.append(level, message); });
}

ConsoleCoordinator::LogSinkInstaller::~LogSinkInstaller()
{
    Logger::clearSink();
}

ConsoleCoordinator::ConsoleCoordinator(const ConsoleConfig &config, ConsoleCollaborators collaborators)
    : m_config(config)
    , m_statusLog(config.statusLogCapacity)
    , m_sinkInstaller(m_statusLog)
    , m_actuator(actuatorOrDefault(std::move(collaborators.actuator)))
    , m_detector(detectorOrDefault(std::move(collaborators.detector), config.targets))
    , m_cameras(config.cameras, std::move(collaborators.deviceFactory))
    , m_pump(m_cameras, config.display)
    , m_session(m_cameras, *m_actuator, *m_detector, config.calibration)
{
    Logger::info(QStringLiteral("Console started: display %1x%2, frame interval %3 ms, actuator %4")
                     .arg(config.display.displaySize.width)
                     .arg(config.display.displaySize.height)
                     .arg(config.display.frameInterval.count())
                     .arg(m_actuator->name()));

    if (!config.recording.path.isEmpty()) {
        m_pump.setRecorder(std::make_unique<FrameRecorder>(config.recording.path, config.recording.fps));
        Logger::info(QStringLiteral("Recording live frames to %1").arg(config.recording.path));
    }

    if (CameraSourceManager::isValidSource(config.activeSource)) {
        const OperationResult selected = m_cameras.select(config.activeSource);
        if (!selected.success) {
            Logger::warning(QStringLiteral("Initial camera %1 not ready: %2")
                                .arg(config.activeSource)
                                .arg(selected.message));
        }
    }
}

ConsoleCoordinator::~ConsoleCoordinator()
{
    if (m_session.status().workerActive) {
        Logger::warning(QStringLiteral("Calibration capture still in flight at shutdown; waiting for it to return"));
    }
    Logger::info(QStringLiteral("Console shutting down"));
}

QImage ConsoleCoordinator::renderImage(qint64 frameIndex)
{
    return m_pump.render(frameIndex);
}

OperationResult ConsoleCoordinator::calibrationStep(int targetId,
                                                    int gridRows,
                                                    int gridCols,
                                                    const QString &locX,
                                                    const QString &locY)
{
    CalibrationStepCommand command;
    command.request.targetId = targetId;
    command.request.gridRows = gridRows;
    command.request.gridCols = gridCols;
    command.request.locX = locX;
    command.request.locY = locY;
    return submit(command);
}

OperationResult ConsoleCoordinator::submit(const Command &command)
{
    if (const auto *select = std::get_if<SelectCommand>(&command)) {
        return m_cameras.select(select->source);
    }
    if (const auto *power = std::get_if<PowerCommand>(&command)) {
        return m_cameras.setPower(power->source, power->on);
    }
    if (const auto *step = std::get_if<CalibrationStepCommand>(&command)) {
        return m_session.submit(step->request);
    }
    return m_session.reset();
}

} // namespace pickcal
