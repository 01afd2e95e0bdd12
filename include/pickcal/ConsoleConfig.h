#pragma once

#include <QJsonObject>
#include <QString>

#include <cstddef>

#include "pickcal/CalibrationSession.h"
#include "pickcal/FramePump.h"
#include "pickcal/StatusLog.h"
#include "pickcal/TargetSpec.h"
#include "pickcal/camera/CameraSourceManager.h"

namespace pickcal {

struct RecordingConfig {
    // Recording is off when empty.
    QString path;
    double fps {30.0};
};

/**
 * Everything the console needs at startup. Defaults describe a machine with a
 * single OpenCV camera on slot 0; a JSON file overrides any subset of keys.
 */
struct ConsoleConfig {
    FramePumpSettings display;
    std::size_t statusLogCapacity {StatusLog::kDefaultCapacity};
    CameraSourceManager::SlotConfigs cameras;
    int activeSource {0};
    CalibrationSessionSettings calibration;
    TargetSpec targets;
    RecordingConfig recording;

    ConsoleConfig();

    bool loadFromFile(const QString &path, QString *errorMessage);
    bool saveToFile(const QString &path, QString *errorMessage) const;

    bool fromJson(const QJsonObject &root, QString *errorMessage);
    QJsonObject toJson() const;

    bool validate(QString *errorMessage) const;
};

} // namespace pickcal
