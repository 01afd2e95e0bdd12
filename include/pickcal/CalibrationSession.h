#pragma once

#include <QFuture>
#include <QString>
#include <QThreadPool>
#include <QtGlobal>

#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "pickcal/CalibrationRequest.h"
#include "pickcal/CalibrationSolver.h"
#include "pickcal/OperationResult.h"
#include "pickcal/TargetDetector.h"

namespace pickcal {

class Actuator;
class CameraSourceManager;

enum class SessionState {
    Idle,
    AwaitingCapture,
    CaptureInProgress,
    Done,
    Failed
};

QString sessionStateName(SessionState state);

struct SessionStatus {
    SessionState state {SessionState::Idle};
    std::optional<CalibrationTarget> target;
    int gridRows {0};
    int gridCols {0};
    int cellIndex {0};
    int capturedCount {0};
    int totalCells {0};
    int attemptsOnCell {0};
    QString lastMessage;
    quint64 generation {0};
    // A capture step is queued or running, possibly a stale one after reset().
    bool workerActive {false};
};

struct CalibrationSessionSettings {
    // Upper bound for maxGridDimension; keeps rows * cols well inside int.
    static constexpr int kGridDimensionLimit = 1024;

    int maxAttemptsPerCell {3};
    int maxGridDimension {32};
    std::chrono::milliseconds actuatorTimeout {5000};
    std::chrono::milliseconds captureTimeout {200};
    // No report is written when empty.
    QString reportDirectory;
};

/**
 * Multi-point calibration capture. Each accepted request moves the target to
 * the requested location, grabs a frame from the active camera and records
 * the detected reference point for the next grid cell. The I/O runs on a
 * dedicated worker thread; callers poll status().
 *
 * reset() returns immediately. An in-flight step notices the new generation
 * at its next checkpoint and drops its result.
 */
class CalibrationSession {
public:
    CalibrationSession(CameraSourceManager &cameras,
                       Actuator &actuator,
                       const TargetDetector &detector,
                       const CalibrationSessionSettings &settings = CalibrationSessionSettings());
    ~CalibrationSession();

    CalibrationSession(const CalibrationSession &) = delete;
    CalibrationSession &operator=(const CalibrationSession &) = delete;

    OperationResult submit(const CalibrationRequest &request);
    OperationResult reset();

    SessionStatus status() const;
    std::vector<CapturedPoint> capturedPoints() const;
    std::optional<CalibrationResult> lastResult() const;
    const CalibrationSessionSettings &settings() const { return m_settings; }

    bool waitForIdleWorker(std::chrono::milliseconds timeout);

private:
    struct StepInput {
        quint64 generation {0};
        int cell {0};
        CalibrationTarget target {CalibrationTarget::Chessboard};
        cv::Point2d location;
    };

    OperationResult validate(const CalibrationRequest &request, CalibrationTarget *target) const;
    void runStep(const StepInput &input);
    bool isCurrent(quint64 generation) const;
    void failStep(const StepInput &input, ErrorCode error, const QString &message);
    void completeStep(const StepInput &input, const TargetDetection &detection);
    void finishSession(quint64 generation);

    CameraSourceManager &m_cameras;
    Actuator &m_actuator;
    const TargetDetector &m_detector;
    const CalibrationSessionSettings m_settings;

    mutable std::mutex m_mutex;
    SessionState m_state {SessionState::Idle};
    std::optional<CalibrationTarget> m_target;
    int m_gridRows {0};
    int m_gridCols {0};
    int m_cellIndex {0};
    int m_attempts {0};
    std::vector<CapturedPoint> m_points;
    cv::Size m_imageSize {0, 0};
    QString m_lastMessage;
    quint64 m_generation {0};
    std::optional<CalibrationResult> m_lastResult;
    QFuture<void> m_worker;

    QThreadPool m_pool;
};

} // namespace pickcal
