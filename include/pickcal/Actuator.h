#pragma once

#include <QString>

#include <chrono>

#include <opencv2/core.hpp>

#include "pickcal/OperationResult.h"

namespace pickcal {

// Positions the calibration target (or the robot head carrying the camera)
// at a location on the machine's XY plane, in millimetres.
class Actuator {
public:
    virtual ~Actuator() = default;

    virtual QString name() const = 0;
    virtual OperationResult moveTo(const cv::Point2d &locationMm, std::chrono::milliseconds timeout) = 0;
};

// The operator jogs the machine by hand; the commanded location is only logged.
class ManualActuator : public Actuator {
public:
    QString name() const override { return QStringLiteral("manual"); }
    OperationResult moveTo(const cv::Point2d &locationMm, std::chrono::milliseconds timeout) override;
};

} // namespace pickcal
