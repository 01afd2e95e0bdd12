#include "pickcal/TargetDetector.h"

#include <algorithm>
#include <array>
#include <exception>
#include <numeric>
#include <utility>

#include <opencv2/calib3d.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

#include "pickcal/Logger.h"

namespace pickcal {

namespace {

cv::Mat ensureGray(const cv::Mat &input)
{
    cv::Mat gray;
    switch (input.channels()) {
    case 1:
        gray = input;
        break;
    case 4:
        cv::cvtColor(input, gray, cv::COLOR_BGRA2GRAY);
        break;
    default:
        cv::cvtColor(input, gray, cv::COLOR_BGR2GRAY);
        break;
    }
    if (gray.depth() == CV_16U) {
        gray.convertTo(gray, CV_8U, 1.0 / 256.0);
    } else if (gray.depth() != CV_8U) {
        gray.convertTo(gray, CV_8U);
    }
    return gray;
}

cv::Point2f centroid(const std::vector<cv::Point2f> &points)
{
    if (points.empty()) {
        return {};
    }
    const cv::Point2f sum = std::accumulate(points.begin(), points.end(), cv::Point2f(0.0f, 0.0f));
    return sum * (1.0f / static_cast<float>(points.size()));
}

const std::array<std::pair<const char *, int>, 18> kArucoDictionaries {{
    {"DICT_4X4_50", cv::aruco::DICT_4X4_50},
    {"DICT_4X4_100", cv::aruco::DICT_4X4_100},
    {"DICT_4X4_250", cv::aruco::DICT_4X4_250},
    {"DICT_4X4_1000", cv::aruco::DICT_4X4_1000},
    {"DICT_5X5_50", cv::aruco::DICT_5X5_50},
    {"DICT_5X5_100", cv::aruco::DICT_5X5_100},
    {"DICT_5X5_250", cv::aruco::DICT_5X5_250},
    {"DICT_5X5_1000", cv::aruco::DICT_5X5_1000},
    {"DICT_6X6_50", cv::aruco::DICT_6X6_50},
    {"DICT_6X6_100", cv::aruco::DICT_6X6_100},
    {"DICT_6X6_250", cv::aruco::DICT_6X6_250},
    {"DICT_6X6_1000", cv::aruco::DICT_6X6_1000},
    {"DICT_7X7_50", cv::aruco::DICT_7X7_50},
    {"DICT_7X7_100", cv::aruco::DICT_7X7_100},
    {"DICT_7X7_250", cv::aruco::DICT_7X7_250},
    {"DICT_7X7_1000", cv::aruco::DICT_7X7_1000},
    {"DICT_ARUCO_ORIGINAL", cv::aruco::DICT_ARUCO_ORIGINAL},
    {"DICT_APRILTAG_36h11", cv::aruco::DICT_APRILTAG_36h11},
}};

} // namespace

bool arucoDictionaryFromName(const QString &name, int *dictionaryId)
{
    const QString wanted = name.trimmed();
    for (const auto &entry : kArucoDictionaries) {
        if (wanted.compare(QLatin1String(entry.first), Qt::CaseInsensitive) == 0) {
            if (dictionaryId) {
                *dictionaryId = entry.second;
            }
            return true;
        }
    }
    return false;
}

OpenCvTargetDetector::OpenCvTargetDetector(const TargetSpec &spec, const DetectionConfig &config)
    : m_spec(spec)
    , m_cfg(config)
{
}

TargetDetection OpenCvTargetDetector::detect(const cv::Mat &frame, CalibrationTarget target) const
{
    TargetDetection result;
    const auto start = std::chrono::steady_clock::now();
    const QString targetName = calibrationTargetName(target);
    QString stage = QStringLiteral("ensure_gray");

    auto finish = [&result, start]() {
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        return result;
    };

    if (frame.empty()) {
        result.message = QStringLiteral("Input image is empty");
        return finish();
    }

    try {
        const cv::Mat gray = ensureGray(frame);
        result.resolution = gray.size();

        bool found = false;
        switch (target) {
        case CalibrationTarget::Chessboard:
            stage = QStringLiteral("find_chessboard");
            found = detectChessboard(gray, result);
            break;
        case CalibrationTarget::CircleGrid:
            stage = QStringLiteral("find_circles_grid");
            found = detectCircleGrid(gray, result);
            break;
        case CalibrationTarget::ArucoMarker:
            stage = QStringLiteral("detect_markers");
            found = detectArucoMarker(gray, result);
            break;
        }

        result.success = found;
        if (found) {
            result.message = QStringLiteral("%1 found at (%2, %3) px")
                                 .arg(targetName)
                                 .arg(result.referencePoint.x, 0, 'f', 2)
                                 .arg(result.referencePoint.y, 0, 'f', 2);
        }
    } catch (const cv::Exception &ex) {
        Logger::error(QStringLiteral("%1 detection: OpenCV exception @%2 -> %3 | size=%4x%5")
                          .arg(targetName, stage, QString::fromUtf8(ex.what()))
                          .arg(frame.cols)
                          .arg(frame.rows));
        result.success = false;
        result.message = QStringLiteral("OpenCV error during %1: %2").arg(stage, QString::fromUtf8(ex.what()));
    } catch (const std::exception &ex) {
        Logger::error(QStringLiteral("%1 detection: exception @%2 -> %3")
                          .arg(targetName, stage, QString::fromUtf8(ex.what())));
        result.success = false;
        result.message = QStringLiteral("Error during %1: %2").arg(stage, QString::fromUtf8(ex.what()));
    }
    return finish();
}

bool OpenCvTargetDetector::detectChessboard(const cv::Mat &gray, TargetDetection &result) const
{
    const ChessboardSpec &board = m_spec.chessboard;
    std::vector<cv::Point2f> corners;
    int flags = cv::CALIB_CB_ADAPTIVE_THRESH | cv::CALIB_CB_NORMALIZE_IMAGE;
    if (m_cfg.chessboardFastCheck) {
        flags |= cv::CALIB_CB_FAST_CHECK;
    }
    if (!cv::findChessboardCorners(gray, board.patternSize(), corners, flags)) {
        result.message = QStringLiteral("No %1x%2 chessboard in view").arg(board.cols).arg(board.rows);
        return false;
    }

    cv::cornerSubPix(gray, corners, m_cfg.subPixWindow, cv::Size(-1, -1),
                     cv::TermCriteria(cv::TermCriteria::COUNT | cv::TermCriteria::EPS,
                                      m_cfg.subPixMaxIterations, m_cfg.subPixEpsilon));

    result.imagePoints = corners;
    result.objectPoints = board.buildObjectPoints();
    result.referencePoint = centroid(corners);
    return true;
}

bool OpenCvTargetDetector::detectCircleGrid(const cv::Mat &gray, TargetDetection &result) const
{
    const CircleGridSpec &grid = m_spec.circleGrid;
    std::vector<cv::Point2f> centers;
    const int flags = grid.asymmetric ? cv::CALIB_CB_ASYMMETRIC_GRID : cv::CALIB_CB_SYMMETRIC_GRID;
    if (!cv::findCirclesGrid(gray, grid.patternSize(), centers, flags)) {
        result.message = QStringLiteral("No %1x%2 circle grid in view").arg(grid.cols).arg(grid.rows);
        return false;
    }

    result.imagePoints = centers;
    result.objectPoints = grid.buildObjectPoints();
    result.referencePoint = centroid(centers);
    return true;
}

bool OpenCvTargetDetector::detectArucoMarker(const cv::Mat &gray, TargetDetection &result) const
{
    const ArucoSpec &marker = m_spec.aruco;
    int dictionaryId = 0;
    if (!arucoDictionaryFromName(marker.dictionary, &dictionaryId)) {
        result.message = QStringLiteral("Unknown ArUco dictionary \"%1\"").arg(marker.dictionary);
        return false;
    }

    cv::aruco::DetectorParameters params;
    params.cornerRefinementMethod = cv::aruco::CORNER_REFINE_SUBPIX;
    const cv::aruco::ArucoDetector detector(cv::aruco::getPredefinedDictionary(dictionaryId), params);

    std::vector<std::vector<cv::Point2f>> corners;
    std::vector<int> ids;
    detector.detectMarkers(gray, corners, ids);

    const auto it = std::find(ids.begin(), ids.end(), marker.markerId);
    if (it == ids.end()) {
        result.message = ids.empty()
                             ? QStringLiteral("No ArUco marker in view")
                             : QStringLiteral("ArUco marker %1 not in view (%2 other markers seen)")
                                   .arg(marker.markerId)
                                   .arg(static_cast<int>(ids.size()));
        return false;
    }

    const auto &quad = corners[static_cast<size_t>(std::distance(ids.begin(), it))];
    const float half = static_cast<float>(marker.markerMm / 2.0);
    result.imagePoints = quad;
    // Corner order of cv::aruco: top-left, top-right, bottom-right, bottom-left.
    result.objectPoints = {{-half, half, 0.0f}, {half, half, 0.0f}, {half, -half, 0.0f}, {-half, -half, 0.0f}};
    result.referencePoint = centroid(quad);
    return true;
}

} // namespace pickcal
