#pragma once

#include <QString>

#include <chrono>
#include <vector>

#include <opencv2/core.hpp>

#include "pickcal/CalibrationRequest.h"
#include "pickcal/TargetSpec.h"

namespace pickcal {

struct TargetDetection {
    bool success {false};
    QString message;
    std::chrono::milliseconds elapsed {0};
    cv::Size resolution {0, 0};
    // The single image coordinate recorded for the grid cell.
    cv::Point2f referencePoint;
    // Pattern features and their board coordinates, used for intrinsics.
    std::vector<cv::Point2f> imagePoints;
    std::vector<cv::Point3f> objectPoints;
};

class TargetDetector {
public:
    virtual ~TargetDetector() = default;

    virtual TargetDetection detect(const cv::Mat &frame, CalibrationTarget target) const = 0;
};

struct DetectionConfig {
    cv::Size subPixWindow {11, 11};
    int subPixMaxIterations {30};
    double subPixEpsilon {0.1};
    bool chessboardFastCheck {false};
};

class OpenCvTargetDetector : public TargetDetector {
public:
    explicit OpenCvTargetDetector(const TargetSpec &spec, const DetectionConfig &config = DetectionConfig());

    TargetDetection detect(const cv::Mat &frame, CalibrationTarget target) const override;

    const TargetSpec &spec() const { return m_spec; }

private:
    bool detectChessboard(const cv::Mat &gray, TargetDetection &result) const;
    bool detectCircleGrid(const cv::Mat &gray, TargetDetection &result) const;
    bool detectArucoMarker(const cv::Mat &gray, TargetDetection &result) const;

    TargetSpec m_spec;
    DetectionConfig m_cfg;
};

// Maps "DICT_4X4_50"-style names to cv::aruco::PredefinedDictionaryType.
bool arucoDictionaryFromName(const QString &name, int *dictionaryId);

} // namespace pickcal
