#include "pickcal/CalibrationSolver.h"

#include <algorithm>
#include <cmath>
#include <numeric>

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <opencv2/calib3d.hpp>
#include <opencv2/core.hpp>

#include "pickcal/Logger.h"

namespace pickcal {

namespace {

QJsonArray matToJson(const cv::Mat &mat)
{
    QJsonArray outer;
    if (mat.empty()) {
        return outer;
    }
    cv::Mat values;
    mat.convertTo(values, CV_64F);
    for (int r = 0; r < values.rows; ++r) {
        QJsonArray row;
        for (int c = 0; c < values.cols; ++c) {
            row.append(values.at<double>(r, c));
        }
        outer.append(row);
    }
    return outer;
}

void solveIntrinsics(const std::vector<CapturedPoint> &points, CalibrationResult &result)
{
    std::vector<std::vector<cv::Point3f>> objectPoints;
    std::vector<std::vector<cv::Point2f>> imagePoints;
    for (const auto &point : points) {
        if (point.patternImagePoints.empty() ||
            point.patternImagePoints.size() != point.patternObjectPoints.size()) {
            continue;
        }
        objectPoints.push_back(point.patternObjectPoints);
        imagePoints.push_back(point.patternImagePoints);
    }

    if (static_cast<int>(imagePoints.size()) < CalibrationSolver::kMinIntrinsicViews) {
        Logger::info(QStringLiteral("Intrinsic calibration skipped: %1 pattern views (need %2)")
                         .arg(static_cast<int>(imagePoints.size()))
                         .arg(CalibrationSolver::kMinIntrinsicViews));
        return;
    }

    cv::Mat cameraMatrix = cv::Mat::eye(3, 3, CV_64F);
    cv::Mat distCoeffs = cv::Mat::zeros(8, 1, CV_64F);
    std::vector<cv::Mat> rvecs;
    std::vector<cv::Mat> tvecs;
    try {
        result.rms = cv::calibrateCamera(objectPoints, imagePoints, result.imageSize,
                                         cameraMatrix, distCoeffs, rvecs, tvecs, 0,
                                         cv::TermCriteria(cv::TermCriteria::COUNT | cv::TermCriteria::EPS, 30, 0.1));
    } catch (const cv::Exception &ex) {
        Logger::warning(QStringLiteral("Intrinsic calibration failed: %1").arg(QString::fromUtf8(ex.what())));
        return;
    }

    result.intrinsicsSolved = true;
    result.cameraMatrix = cameraMatrix;
    result.distCoeffs = distCoeffs;
    Logger::info(QStringLiteral("Intrinsics: views=%1 | RMS=%2 px | fx=%3 fy=%4 cx=%5 cy=%6")
                     .arg(static_cast<int>(imagePoints.size()))
                     .arg(result.rms, 0, 'f', 3)
                     .arg(cameraMatrix.at<double>(0, 0), 0, 'f', 1)
                     .arg(cameraMatrix.at<double>(1, 1), 0, 'f', 1)
                     .arg(cameraMatrix.at<double>(0, 2), 0, 'f', 1)
                     .arg(cameraMatrix.at<double>(1, 2), 0, 'f', 1));
}

} // namespace

cv::Point2d CalibrationSolver::mapToWorld(const cv::Mat &homography, const cv::Point2f &imagePoint)
{
    std::vector<cv::Point2d> src {cv::Point2d(imagePoint.x, imagePoint.y)};
    std::vector<cv::Point2d> dst;
    cv::perspectiveTransform(src, dst, homography);
    return dst.front();
}

CalibrationResult CalibrationSolver::solve(const std::vector<CapturedPoint> &points,
                                           CalibrationTarget target,
                                           int gridRows,
                                           int gridCols,
                                           const cv::Size &imageSize)
{
    CalibrationResult result;
    result.target = target;
    result.gridRows = gridRows;
    result.gridCols = gridCols;
    result.pointCount = static_cast<int>(points.size());
    result.imageSize = imageSize;

    if (result.pointCount < kMinMappingPoints) {
        result.message = QStringLiteral("Not enough points (%1) for a camera-to-world mapping, need %2")
                             .arg(result.pointCount)
                             .arg(kMinMappingPoints);
        Logger::warning(result.message);
        return result;
    }

    std::vector<cv::Point2f> imagePoints;
    std::vector<cv::Point2f> worldPoints;
    imagePoints.reserve(points.size());
    worldPoints.reserve(points.size());
    for (const auto &point : points) {
        imagePoints.push_back(point.imagePoint);
        worldPoints.emplace_back(static_cast<float>(point.worldMm.x), static_cast<float>(point.worldMm.y));
    }

    cv::Mat homography;
    try {
        const int method = result.pointCount > 8 ? cv::RANSAC : 0;
        homography = cv::findHomography(imagePoints, worldPoints, method, 2.0);
    } catch (const cv::Exception &ex) {
        result.message = QStringLiteral("Homography estimation failed: %1").arg(QString::fromUtf8(ex.what()));
        Logger::warning(result.message);
        return result;
    }
    if (homography.empty()) {
        result.message = QStringLiteral("Homography estimation failed: points are degenerate");
        Logger::warning(result.message);
        return result;
    }

    std::vector<cv::Point2f> projected;
    cv::perspectiveTransform(imagePoints, projected, homography);
    result.residualsMm.reserve(projected.size());
    for (size_t i = 0; i < projected.size(); ++i) {
        const cv::Point2f delta = projected[i] - worldPoints[i];
        result.residualsMm.push_back(std::hypot(static_cast<double>(delta.x), static_cast<double>(delta.y)));
    }
    result.meanErrorMm = std::accumulate(result.residualsMm.begin(), result.residualsMm.end(), 0.0) /
                         static_cast<double>(result.residualsMm.size());
    result.maxErrorMm = *std::max_element(result.residualsMm.begin(), result.residualsMm.end());
    result.homography = homography;

    Logger::info(QStringLiteral("Camera-to-world mapping: points=%1 | mean=%2 mm | max=%3 mm")
                     .arg(result.pointCount)
                     .arg(result.meanErrorMm, 0, 'f', 3)
                     .arg(result.maxErrorMm, 0, 'f', 3));

    if (target != CalibrationTarget::ArucoMarker && imageSize.area() > 0) {
        solveIntrinsics(points, result);
    }

    result.success = true;
    result.message = QStringLiteral("Calibration solved from %1 points").arg(result.pointCount);
    return result;
}

bool CalibrationSolver::exportReport(const CalibrationResult &result,
                                     const std::vector<CapturedPoint> &points,
                                     const QString &directory,
                                     QString *errorMessage)
{
    QDir dir(directory);
    if (!dir.exists() && !dir.mkpath(QStringLiteral("."))) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Cannot create report directory %1").arg(directory);
        }
        return false;
    }

    QJsonObject root;
    root.insert("success", result.success);
    root.insert("message", result.message);
    root.insert("generated_at", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    root.insert("target", calibrationTargetName(result.target));
    root.insert("grid_rows", result.gridRows);
    root.insert("grid_cols", result.gridCols);
    root.insert("image_size", QJsonArray{result.imageSize.width, result.imageSize.height});
    root.insert("homography_image_to_world", matToJson(result.homography));
    root.insert("mean_error_mm", result.meanErrorMm);
    root.insert("max_error_mm", result.maxErrorMm);

    if (result.intrinsicsSolved) {
        QJsonObject intrinsics;
        intrinsics.insert("rms", result.rms);
        intrinsics.insert("camera_matrix", matToJson(result.cameraMatrix));
        intrinsics.insert("distortion_coefficients", matToJson(result.distCoeffs));
        root.insert("intrinsics", intrinsics);
    }

    QJsonArray pointsJson;
    for (size_t i = 0; i < points.size(); ++i) {
        const auto &point = points[i];
        QJsonObject item;
        item.insert("cell", point.cell);
        item.insert("row", point.row);
        item.insert("col", point.col);
        item.insert("image_px", QJsonArray{point.imagePoint.x, point.imagePoint.y});
        item.insert("world_mm", QJsonArray{point.worldMm.x, point.worldMm.y});
        if (i < result.residualsMm.size()) {
            item.insert("residual_mm", result.residualsMm[i]);
        }
        item.insert("captured_at", point.capturedAt.toUTC().toString(Qt::ISODateWithMs));
        pointsJson.append(item);
    }
    root.insert("points", pointsJson);

    const QString jsonPath = dir.filePath(QStringLiteral("calibration_report.json"));
    QFile file(jsonPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Failed to write %1: %2").arg(jsonPath, file.errorString());
        }
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    Logger::info(QStringLiteral("Calibration report written to %1").arg(jsonPath));
    return true;
}

} // namespace pickcal
