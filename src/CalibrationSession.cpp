#include "pickcal/CalibrationSession.h"

#include <QtConcurrent/QtConcurrent>

#include <algorithm>
#include <exception>

#include "pickcal/Actuator.h"
#include "pickcal/Logger.h"
#include "pickcal/camera/CameraSourceManager.h"

namespace pickcal {

QString sessionStateName(SessionState state)
{
    switch (state) {
    case SessionState::Idle:
        return QStringLiteral("Idle");
    case SessionState::AwaitingCapture:
        return QStringLiteral("AwaitingCapture");
    case SessionState::CaptureInProgress:
        return QStringLiteral("CaptureInProgress");
    case SessionState::Done:
        return QStringLiteral("Done");
    case SessionState::Failed:
        return QStringLiteral("Failed");
    }
    return QStringLiteral("Unknown");
}

CalibrationSession::CalibrationSession(CameraSourceManager &cameras,
                                       Actuator &actuator,
                                       const TargetDetector &detector,
                                       const CalibrationSessionSettings &settings)
    : m_cameras(cameras)
    , m_actuator(actuator)
    , m_detector(detector)
    , m_settings(settings)
{
    m_pool.setMaxThreadCount(1);
}

CalibrationSession::~CalibrationSession()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_generation;
    }
    m_pool.waitForDone();
}

OperationResult CalibrationSession::validate(const CalibrationRequest &request, CalibrationTarget *target) const
{
    const auto parsed = calibrationTargetFromId(request.targetId);
    if (!parsed) {
        return OperationResult::failure(ErrorCode::InvalidRequest,
                                        QStringLiteral("Unknown calibration target %1").arg(request.targetId));
    }
    const int maxDim = std::min(m_settings.maxGridDimension, CalibrationSessionSettings::kGridDimensionLimit);
    if (request.gridRows < 1 || request.gridRows > maxDim || request.gridCols < 1 || request.gridCols > maxDim) {
        return OperationResult::failure(ErrorCode::InvalidRequest,
                                        QStringLiteral("Grid %1x%2 is outside 1..%3")
                                            .arg(request.gridRows)
                                            .arg(request.gridCols)
                                            .arg(maxDim));
    }
    *target = *parsed;
    return OperationResult::ok();
}

OperationResult CalibrationSession::submit(const CalibrationRequest &request)
{
    auto reject = [](const OperationResult &result) {
        Logger::warning(QStringLiteral("Calibration request rejected (%1): %2")
                            .arg(errorCodeName(result.error), result.message));
        return result;
    };

    CalibrationTarget target = CalibrationTarget::Chessboard;
    const OperationResult valid = validate(request, &target);
    if (!valid.success) {
        return reject(valid);
    }

    cv::Point2d location;
    QString parseError;
    const bool locationValid = parseLocation(request, &location, &parseError);

    OperationResult rejection;
    QString startedMessage;
    StepInput input;
    {
        std::lock_guard<std::mutex> lock(m_mutex);

        switch (m_state) {
        case SessionState::CaptureInProgress:
            rejection = OperationResult::failure(ErrorCode::Busy, QStringLiteral("A capture is already in progress"));
            break;
        case SessionState::Done:
        case SessionState::Failed:
            rejection = OperationResult::failure(ErrorCode::SessionClosed,
                                                 QStringLiteral("Session is %1; reset to start a new one")
                                                     .arg(sessionStateName(m_state)));
            break;
        case SessionState::AwaitingCapture:
            if (request.gridRows != m_gridRows || request.gridCols != m_gridCols) {
                rejection = OperationResult::failure(ErrorCode::GridMismatch,
                                                     QStringLiteral("Grid %1x%2 does not match the active %3x%4 session")
                                                         .arg(request.gridRows)
                                                         .arg(request.gridCols)
                                                         .arg(m_gridRows)
                                                         .arg(m_gridCols));
            } else if (m_target != target) {
                rejection = OperationResult::failure(ErrorCode::TargetMismatch,
                                                     QStringLiteral("Target %1 does not match the active %2 session")
                                                         .arg(calibrationTargetName(target),
                                                              calibrationTargetName(*m_target)));
            }
            break;
        case SessionState::Idle:
            break;
        }
        if (rejection.error == ErrorCode::None && !locationValid) {
            rejection = OperationResult::failure(ErrorCode::InvalidLocation, parseError);
        }

        if (rejection.error == ErrorCode::None) {
            if (m_state == SessionState::Idle) {
                m_target = target;
                m_gridRows = request.gridRows;
                m_gridCols = request.gridCols;
                m_cellIndex = 0;
                m_attempts = 0;
                m_points.clear();
                m_imageSize = cv::Size(0, 0);
                m_lastResult.reset();
                startedMessage = QStringLiteral("Calibration session started: %1, %2x%3 grid (%4 points)")
                                     .arg(calibrationTargetName(target))
                                     .arg(m_gridRows)
                                     .arg(m_gridCols)
                                     .arg(m_gridRows * m_gridCols);
            }

            input.generation = m_generation;
            input.cell = m_cellIndex;
            input.target = target;
            input.location = location;
            m_state = SessionState::CaptureInProgress;
            m_lastMessage = QStringLiteral("Capturing cell %1/%2").arg(m_cellIndex + 1).arg(m_gridRows * m_gridCols);
            m_worker = QtConcurrent::run(&m_pool, [this, input]() { runStep(input); });
        }
    }

    if (rejection.error != ErrorCode::None) {
        return reject(rejection);
    }
    if (!startedMessage.isEmpty()) {
        Logger::info(startedMessage);
    }
    return OperationResult::ok(QStringLiteral("Capturing cell %1 at X=%2 mm, Y=%3 mm")
                                   .arg(input.cell + 1)
                                   .arg(input.location.x, 0, 'f', 3)
                                   .arg(input.location.y, 0, 'f', 3));
}

OperationResult CalibrationSession::reset()
{
    bool wasBusy = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        wasBusy = m_state == SessionState::CaptureInProgress;
        ++m_generation;
        m_state = SessionState::Idle;
        m_target.reset();
        m_gridRows = 0;
        m_gridCols = 0;
        m_cellIndex = 0;
        m_attempts = 0;
        m_points.clear();
        m_imageSize = cv::Size(0, 0);
        m_lastMessage = QStringLiteral("Session reset");
    }
    Logger::info(wasBusy ? QStringLiteral("Calibration session reset; the in-flight capture will be discarded")
                         : QStringLiteral("Calibration session reset"));
    return OperationResult::ok(QStringLiteral("Session reset"));
}

bool CalibrationSession::isCurrent(quint64 generation) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return generation == m_generation;
}

void CalibrationSession::runStep(const StepInput &input)
{
    const QString cellLabel = QStringLiteral("Cell %1").arg(input.cell + 1);
    Logger::info(QStringLiteral("%1: moving to X=%2 mm, Y=%3 mm")
                     .arg(cellLabel)
                     .arg(input.location.x, 0, 'f', 3)
                     .arg(input.location.y, 0, 'f', 3));

    OperationResult moved;
    try {
        moved = m_actuator.moveTo(input.location, m_settings.actuatorTimeout);
    } catch (const std::exception &ex) {
        moved = OperationResult::failure(ErrorCode::ActuatorFault, QString::fromUtf8(ex.what()));
    }
    if (!isCurrent(input.generation)) {
        Logger::info(QStringLiteral("%1: capture aborted by reset").arg(cellLabel));
        return;
    }
    if (!moved.success) {
        failStep(input, ErrorCode::ActuatorFault,
                 QStringLiteral("%1: actuator %2 failed: %3").arg(cellLabel, m_actuator.name(), moved.message));
        return;
    }

    const FrameResult frame = m_cameras.captureFrame(m_settings.captureTimeout, false);
    if (!isCurrent(input.generation)) {
        Logger::info(QStringLiteral("%1: capture aborted by reset").arg(cellLabel));
        return;
    }
    if (!frame.success) {
        failStep(input, frame.error, QStringLiteral("%1: no frame: %2").arg(cellLabel, frame.message));
        return;
    }

    TargetDetection detection;
    try {
        detection = m_detector.detect(frame.frame.image, input.target);
    } catch (const std::exception &ex) {
        detection.success = false;
        detection.message = QString::fromUtf8(ex.what());
    }
    if (!isCurrent(input.generation)) {
        Logger::info(QStringLiteral("%1: capture aborted by reset").arg(cellLabel));
        return;
    }
    if (!detection.success) {
        failStep(input, ErrorCode::DetectionFailure,
                 QStringLiteral("%1: detection failed: %2").arg(cellLabel, detection.message));
        return;
    }

    completeStep(input, detection);
}

void CalibrationSession::failStep(const StepInput &input, ErrorCode error, const QString &message)
{
    bool failed = false;
    QString text;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (input.generation != m_generation) {
            return;
        }

        ++m_attempts;
        failed = !isRetryable(error) || m_attempts >= m_settings.maxAttemptsPerCell;
        m_state = failed ? SessionState::Failed : SessionState::AwaitingCapture;
        m_lastMessage = QStringLiteral("%1 (%2, attempt %3/%4); %5")
                            .arg(message, errorCodeName(error))
                            .arg(m_attempts)
                            .arg(m_settings.maxAttemptsPerCell)
                            .arg(failed ? QStringLiteral("session failed") : QStringLiteral("retry the same cell"));
        text = m_lastMessage;
    }

    if (failed) {
        Logger::error(text);
    } else {
        Logger::warning(text);
    }
}

void CalibrationSession::completeStep(const StepInput &input, const TargetDetection &detection)
{
    bool finished = false;
    QString capturedMessage;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (input.generation != m_generation) {
            return;
        }

        CapturedPoint point;
        point.cell = input.cell;
        point.row = input.cell / m_gridCols;
        point.col = input.cell % m_gridCols;
        point.imagePoint = detection.referencePoint;
        point.worldMm = input.location;
        point.patternImagePoints = detection.imagePoints;
        point.patternObjectPoints = detection.objectPoints;
        point.capturedAt = QDateTime::currentDateTime();
        m_points.push_back(point);
        if (m_imageSize.area() == 0) {
            m_imageSize = detection.resolution;
        }

        m_attempts = 0;
        m_cellIndex = input.cell + 1;
        const int total = m_gridRows * m_gridCols;
        m_lastMessage = QStringLiteral("Cell %1/%2 captured: image (%3, %4) px -> world (%5, %6) mm")
                            .arg(input.cell + 1)
                            .arg(total)
                            .arg(point.imagePoint.x, 0, 'f', 2)
                            .arg(point.imagePoint.y, 0, 'f', 2)
                            .arg(point.worldMm.x, 0, 'f', 3)
                            .arg(point.worldMm.y, 0, 'f', 3);
        capturedMessage = m_lastMessage;

        finished = m_cellIndex >= total;
        if (!finished) {
            m_state = SessionState::AwaitingCapture;
        }
    }

    Logger::info(capturedMessage);
    if (finished) {
        finishSession(input.generation);
    }
}

void CalibrationSession::finishSession(quint64 generation)
{
    std::vector<CapturedPoint> points;
    CalibrationTarget target = CalibrationTarget::Chessboard;
    int rows = 0;
    int cols = 0;
    cv::Size imageSize;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            return;
        }
        points = m_points;
        target = m_target.value_or(CalibrationTarget::Chessboard);
        rows = m_gridRows;
        cols = m_gridCols;
        imageSize = m_imageSize;
    }

    CalibrationResult result = CalibrationSolver::solve(points, target, rows, cols, imageSize);
    if (result.success && !m_settings.reportDirectory.isEmpty()) {
        QString error;
        if (!CalibrationSolver::exportReport(result, points, m_settings.reportDirectory, &error)) {
            Logger::warning(QStringLiteral("Calibration report not written (%1): %2")
                                .arg(errorCodeName(ErrorCode::IoError), error));
        }
    }

    const QString summary = result.success
                                ? QStringLiteral("Calibration complete: %1 points, mean error %2 mm")
                                      .arg(result.pointCount)
                                      .arg(result.meanErrorMm, 0, 'f', 3)
                                : QStringLiteral("Calibration complete; solver failed: %1").arg(result.message);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (generation != m_generation) {
            return;
        }
        m_lastResult = result;
        m_state = SessionState::Done;
        m_lastMessage = summary;
    }
    Logger::info(summary);
}

SessionStatus CalibrationSession::status() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    SessionStatus status;
    status.state = m_state;
    status.target = m_target;
    status.gridRows = m_gridRows;
    status.gridCols = m_gridCols;
    status.cellIndex = m_cellIndex;
    status.capturedCount = static_cast<int>(m_points.size());
    status.totalCells = m_gridRows * m_gridCols;
    status.attemptsOnCell = m_attempts;
    status.lastMessage = m_lastMessage;
    status.generation = m_generation;
    status.workerActive = !m_worker.isFinished();
    return status;
}

std::vector<CapturedPoint> CalibrationSession::capturedPoints() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_points;
}

std::optional<CalibrationResult> CalibrationSession::lastResult() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastResult;
}

bool CalibrationSession::waitForIdleWorker(std::chrono::milliseconds timeout)
{
    return m_pool.waitForDone(static_cast<int>(timeout.count()));
}

} // namespace pickcal
