#include "pickcal/Actuator.h"

#include "pickcal/Logger.h"

namespace pickcal {

OperationResult ManualActuator::moveTo(const cv::Point2d &locationMm, std::chrono::milliseconds timeout)
{
    Q_UNUSED(timeout);
    Logger::info(QStringLiteral("Position the target at X=%1 mm, Y=%2 mm")
                     .arg(locationMm.x, 0, 'f', 3)
                     .arg(locationMm.y, 0, 'f', 3));
    return OperationResult::ok();
}

} // namespace pickcal
