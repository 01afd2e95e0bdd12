#pragma once

#include <QDateTime>
#include <QString>

#include <vector>

#include <opencv2/core.hpp>

#include "pickcal/CalibrationRequest.h"

namespace pickcal {

// One completed grid cell of a calibration session.
struct CapturedPoint {
    int cell {0};
    int row {0};
    int col {0};
    cv::Point2f imagePoint;
    cv::Point2d worldMm;
    std::vector<cv::Point2f> patternImagePoints;
    std::vector<cv::Point3f> patternObjectPoints;
    QDateTime capturedAt;
};

struct CalibrationResult {
    bool success {false};
    QString message;
    CalibrationTarget target {CalibrationTarget::Chessboard};
    int gridRows {0};
    int gridCols {0};
    int pointCount {0};
    cv::Size imageSize {0, 0};

    // Image pixel -> machine XY (mm).
    cv::Mat homography;
    std::vector<double> residualsMm;
    double meanErrorMm {0.0};
    double maxErrorMm {0.0};

    bool intrinsicsSolved {false};
    cv::Mat cameraMatrix;
    cv::Mat distCoeffs;
    double rms {0.0};
};

class CalibrationSolver {
public:
    static constexpr int kMinMappingPoints = 4;
    static constexpr int kMinIntrinsicViews = 3;

    static CalibrationResult solve(const std::vector<CapturedPoint> &points,
                                   CalibrationTarget target,
                                   int gridRows,
                                   int gridCols,
                                   const cv::Size &imageSize);

    static bool exportReport(const CalibrationResult &result,
                             const std::vector<CapturedPoint> &points,
                             const QString &directory,
                             QString *errorMessage);

    static cv::Point2d mapToWorld(const cv::Mat &homography, const cv::Point2f &imagePoint);
};

} // namespace pickcal
