#include "pickcal/CalibrationRequest.h"

#include <QLocale>

#include <cmath>

namespace pickcal {

std::optional<CalibrationTarget> calibrationTargetFromId(int id)
{
    switch (id) {
    case 0:
        return CalibrationTarget::Chessboard;
    case 1:
        return CalibrationTarget::CircleGrid;
    case 2:
        return CalibrationTarget::ArucoMarker;
    default:
        return std::nullopt;
    }
}

QString calibrationTargetName(CalibrationTarget target)
{
    switch (target) {
    case CalibrationTarget::Chessboard:
        return QStringLiteral("chessboard");
    case CalibrationTarget::CircleGrid:
        return QStringLiteral("circle grid");
    case CalibrationTarget::ArucoMarker:
        return QStringLiteral("ArUco marker");
    }
    return QStringLiteral("unknown");
}

std::optional<double> parseLocationValue(const QString &text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    QLocale locale = QLocale::c();
    locale.setNumberOptions(QLocale::RejectGroupSeparator);
    bool ok = false;
    const double value = locale.toDouble(trimmed, &ok);
    if (!ok || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

bool parseLocation(const CalibrationRequest &request, cv::Point2d *location, QString *errorMessage)
{
    const auto x = parseLocationValue(request.locX);
    const auto y = parseLocationValue(request.locY);
    if (!x || !y) {
        if (errorMessage) {
            const QString field = !x ? QStringLiteral("loc_x") : QStringLiteral("loc_y");
            const QString value = !x ? request.locX : request.locY;
            *errorMessage = QStringLiteral("%1 \"%2\" is not a decimal number").arg(field, value);
        }
        return false;
    }
    if (location) {
        *location = cv::Point2d(*x, *y);
    }
    return true;
}

} // namespace pickcal
