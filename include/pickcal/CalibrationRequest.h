#pragma once

#include <QString>

#include <optional>

#include <opencv2/core.hpp>

namespace pickcal {

enum class CalibrationTarget {
    Chessboard = 0,
    CircleGrid = 1,
    ArucoMarker = 2
};

std::optional<CalibrationTarget> calibrationTargetFromId(int id);
QString calibrationTargetName(CalibrationTarget target);

// One click of the calibrate button. Locations arrive as text from the
// console's input fields.
struct CalibrationRequest {
    int targetId {0};
    int gridRows {0};
    int gridCols {0};
    QString locX;
    QString locY;
};

// Locale-independent decimal ("12.5", "-3", "1e2"); surrounding whitespace is
// ignored. Non-finite values are rejected.
std::optional<double> parseLocationValue(const QString &text);

bool parseLocation(const CalibrationRequest &request, cv::Point2d *location, QString *errorMessage);

} // namespace pickcal
