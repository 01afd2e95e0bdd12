#include "pickcal/ConsoleConfig.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

#include <cmath>
#include <limits>

#include "pickcal/TargetDetector.h"

namespace pickcal {

namespace {

void setError(QString *errorMessage, const QString &text)
{
    if (errorMessage) {
        *errorMessage = text;
    }
}

bool readInt(const QJsonObject &obj, const char *key, const QString &section, int *out, QString *errorMessage)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    const double number = value.toDouble(std::nan(""));
    if (!value.isDouble() || std::floor(number) != number) {
        setError(errorMessage, QStringLiteral("%1.%2 must be an integer").arg(section, QLatin1String(key)));
        return false;
    }
    if (number < static_cast<double>(std::numeric_limits<int>::min()) ||
        number > static_cast<double>(std::numeric_limits<int>::max())) {
        setError(errorMessage, QStringLiteral("%1.%2 is out of range").arg(section, QLatin1String(key)));
        return false;
    }
    *out = static_cast<int>(number);
    return true;
}

bool readDouble(const QJsonObject &obj, const char *key, const QString &section, double *out, QString *errorMessage)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isDouble()) {
        setError(errorMessage, QStringLiteral("%1.%2 must be a number").arg(section, QLatin1String(key)));
        return false;
    }
    *out = value.toDouble();
    return true;
}

bool readBool(const QJsonObject &obj, const char *key, const QString &section, bool *out, QString *errorMessage)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isBool()) {
        setError(errorMessage, QStringLiteral("%1.%2 must be true or false").arg(section, QLatin1String(key)));
        return false;
    }
    *out = value.toBool();
    return true;
}

bool readString(const QJsonObject &obj, const char *key, const QString &section, QString *out, QString *errorMessage)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isString()) {
        setError(errorMessage, QStringLiteral("%1.%2 must be a string").arg(section, QLatin1String(key)));
        return false;
    }
    *out = value.toString();
    return true;
}

bool readSection(const QJsonObject &root, const char *key, QJsonObject *out, QString *errorMessage)
{
    const QJsonValue value = root.value(QLatin1String(key));
    if (value.isUndefined()) {
        return true;
    }
    if (!value.isObject()) {
        setError(errorMessage, QStringLiteral("%1 must be an object").arg(QLatin1String(key)));
        return false;
    }
    *out = value.toObject();
    return true;
}

} // namespace

ConsoleConfig::ConsoleConfig()
{
    cameras[0] = {QStringLiteral("Top camera"), QStringLiteral("opencv"), QStringLiteral("0"), true};
    cameras[1] = {QStringLiteral("Bottom camera"), QStringLiteral("none"), QString(), false};
    cameras[2] = {QStringLiteral("Nozzle camera"), QStringLiteral("none"), QString(), false};
    calibration.reportDirectory = QStringLiteral("calibration");
}

bool ConsoleConfig::loadFromFile(const QString &path, QString *errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        setError(errorMessage, QStringLiteral("Failed to open config %1: %2").arg(path, file.errorString()));
        return false;
    }

    QJsonParseError parseError {};
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        setError(errorMessage, QStringLiteral("Invalid config JSON in %1: %2").arg(path, parseError.errorString()));
        return false;
    }
    if (!doc.isObject()) {
        setError(errorMessage, QStringLiteral("Config file %1 is not a JSON object").arg(path));
        return false;
    }
    return fromJson(doc.object(), errorMessage);
}

bool ConsoleConfig::saveToFile(const QString &path, QString *errorMessage) const
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        setError(errorMessage, QStringLiteral("Failed to write config %1: %2").arg(path, file.errorString()));
        return false;
    }
    file.write(QJsonDocument(toJson()).toJson(QJsonDocument::Indented));
    return true;
}

bool ConsoleConfig::fromJson(const QJsonObject &root, QString *errorMessage)
{
    ConsoleConfig next = *this;

    QJsonObject display;
    if (!readSection(root, "display", &display, errorMessage)) {
        return false;
    }
    int width = next.display.displaySize.width;
    int height = next.display.displaySize.height;
    int intervalMs = static_cast<int>(next.display.frameInterval.count());
    if (!readInt(display, "width", QStringLiteral("display"), &width, errorMessage) ||
        !readInt(display, "height", QStringLiteral("display"), &height, errorMessage) ||
        !readInt(display, "frameIntervalMs", QStringLiteral("display"), &intervalMs, errorMessage)) {
        return false;
    }
    next.display.displaySize = cv::Size(width, height);
    next.display.frameInterval = std::chrono::milliseconds(intervalMs);

    QJsonObject statusLog;
    if (!readSection(root, "statusLog", &statusLog, errorMessage)) {
        return false;
    }
    int capacity = static_cast<int>(next.statusLogCapacity);
    if (!readInt(statusLog, "capacity", QStringLiteral("statusLog"), &capacity, errorMessage)) {
        return false;
    }
    if (capacity < 1) {
        setError(errorMessage, QStringLiteral("statusLog.capacity must be at least 1"));
        return false;
    }
    next.statusLogCapacity = static_cast<std::size_t>(capacity);

    const QJsonValue camerasValue = root.value(QStringLiteral("cameras"));
    if (!camerasValue.isUndefined()) {
        if (!camerasValue.isArray()) {
            setError(errorMessage, QStringLiteral("cameras must be an array"));
            return false;
        }
        const QJsonArray array = camerasValue.toArray();
        if (array.size() > CameraSourceManager::kSlotCount) {
            setError(errorMessage, QStringLiteral("cameras lists %1 entries; the console has %2 slots")
                                       .arg(array.size())
                                       .arg(CameraSourceManager::kSlotCount));
            return false;
        }
        for (int i = 0; i < array.size(); ++i) {
            if (!array.at(i).isObject()) {
                setError(errorMessage, QStringLiteral("cameras[%1] must be an object").arg(i));
                return false;
            }
            const QJsonObject camera = array.at(i).toObject();
            const QString section = QStringLiteral("cameras[%1]").arg(i);
            CameraSlotConfig &slot = next.cameras[static_cast<size_t>(i)];
            if (!readString(camera, "name", section, &slot.name, errorMessage) ||
                !readString(camera, "backend", section, &slot.backend, errorMessage) ||
                !readString(camera, "device", section, &slot.device, errorMessage) ||
                !readBool(camera, "powered", section, &slot.powered, errorMessage)) {
                return false;
            }
            slot.backend = slot.backend.trimmed().toLower();
        }
    }

    if (!readInt(root, "activeSource", QStringLiteral("root"), &next.activeSource, errorMessage)) {
        return false;
    }

    QJsonObject calibrationObj;
    if (!readSection(root, "calibration", &calibrationObj, errorMessage)) {
        return false;
    }
    int actuatorMs = static_cast<int>(next.calibration.actuatorTimeout.count());
    int captureMs = static_cast<int>(next.calibration.captureTimeout.count());
    const QString calibrationSection = QStringLiteral("calibration");
    if (!readInt(calibrationObj, "maxAttemptsPerCell", calibrationSection, &next.calibration.maxAttemptsPerCell, errorMessage) ||
        !readInt(calibrationObj, "maxGridDimension", calibrationSection, &next.calibration.maxGridDimension, errorMessage) ||
        !readInt(calibrationObj, "actuatorTimeoutMs", calibrationSection, &actuatorMs, errorMessage) ||
        !readInt(calibrationObj, "captureTimeoutMs", calibrationSection, &captureMs, errorMessage) ||
        !readString(calibrationObj, "reportDirectory", calibrationSection, &next.calibration.reportDirectory, errorMessage)) {
        return false;
    }
    next.calibration.actuatorTimeout = std::chrono::milliseconds(actuatorMs);
    next.calibration.captureTimeout = std::chrono::milliseconds(captureMs);

    QJsonObject targetsObj;
    if (!readSection(root, "targets", &targetsObj, errorMessage)) {
        return false;
    }
    QJsonObject chessboard;
    QJsonObject circleGrid;
    QJsonObject aruco;
    if (!readSection(targetsObj, "chessboard", &chessboard, errorMessage) ||
        !readSection(targetsObj, "circleGrid", &circleGrid, errorMessage) ||
        !readSection(targetsObj, "aruco", &aruco, errorMessage)) {
        return false;
    }
    if (!readInt(chessboard, "cols", QStringLiteral("targets.chessboard"), &next.targets.chessboard.cols, errorMessage) ||
        !readInt(chessboard, "rows", QStringLiteral("targets.chessboard"), &next.targets.chessboard.rows, errorMessage) ||
        !readDouble(chessboard, "squareMm", QStringLiteral("targets.chessboard"), &next.targets.chessboard.squareMm, errorMessage) ||
        !readInt(circleGrid, "cols", QStringLiteral("targets.circleGrid"), &next.targets.circleGrid.cols, errorMessage) ||
        !readInt(circleGrid, "rows", QStringLiteral("targets.circleGrid"), &next.targets.circleGrid.rows, errorMessage) ||
        !readDouble(circleGrid, "spacingMm", QStringLiteral("targets.circleGrid"), &next.targets.circleGrid.spacingMm, errorMessage) ||
        !readBool(circleGrid, "asymmetric", QStringLiteral("targets.circleGrid"), &next.targets.circleGrid.asymmetric, errorMessage) ||
        !readString(aruco, "dictionary", QStringLiteral("targets.aruco"), &next.targets.aruco.dictionary, errorMessage) ||
        !readInt(aruco, "markerId", QStringLiteral("targets.aruco"), &next.targets.aruco.markerId, errorMessage) ||
        !readDouble(aruco, "markerMm", QStringLiteral("targets.aruco"), &next.targets.aruco.markerMm, errorMessage)) {
        return false;
    }

    QJsonObject recordingObj;
    if (!readSection(root, "recording", &recordingObj, errorMessage) ||
        !readString(recordingObj, "path", QStringLiteral("recording"), &next.recording.path, errorMessage) ||
        !readDouble(recordingObj, "fps", QStringLiteral("recording"), &next.recording.fps, errorMessage)) {
        return false;
    }

    if (!next.validate(errorMessage)) {
        return false;
    }
    *this = next;
    return true;
}

QJsonObject ConsoleConfig::toJson() const
{
    QJsonObject root;
    root.insert("display", QJsonObject{
                               {"width", display.displaySize.width},
                               {"height", display.displaySize.height},
                               {"frameIntervalMs", static_cast<int>(display.frameInterval.count())},
                           });
    root.insert("statusLog", QJsonObject{{"capacity", static_cast<int>(statusLogCapacity)}});

    QJsonArray camerasJson;
    for (const auto &slot : cameras) {
        camerasJson.append(QJsonObject{
            {"name", slot.name},
            {"backend", slot.backend},
            {"device", slot.device},
            {"powered", slot.powered},
        });
    }
    root.insert("cameras", camerasJson);
    root.insert("activeSource", activeSource);

    root.insert("calibration", QJsonObject{
                                   {"maxAttemptsPerCell", calibration.maxAttemptsPerCell},
                                   {"maxGridDimension", calibration.maxGridDimension},
                                   {"actuatorTimeoutMs", static_cast<int>(calibration.actuatorTimeout.count())},
                                   {"captureTimeoutMs", static_cast<int>(calibration.captureTimeout.count())},
                                   {"reportDirectory", calibration.reportDirectory},
                               });

    QJsonObject targetsJson;
    targetsJson.insert("chessboard", QJsonObject{
                                         {"cols", targets.chessboard.cols},
                                         {"rows", targets.chessboard.rows},
                                         {"squareMm", targets.chessboard.squareMm},
                                     });
    targetsJson.insert("circleGrid", QJsonObject{
                                         {"cols", targets.circleGrid.cols},
                                         {"rows", targets.circleGrid.rows},
                                         {"spacingMm", targets.circleGrid.spacingMm},
                                         {"asymmetric", targets.circleGrid.asymmetric},
                                     });
    targetsJson.insert("aruco", QJsonObject{
                                    {"dictionary", targets.aruco.dictionary},
                                    {"markerId", targets.aruco.markerId},
                                    {"markerMm", targets.aruco.markerMm},
                                });
    root.insert("targets", targetsJson);

    root.insert("recording", QJsonObject{{"path", recording.path}, {"fps", recording.fps}});
    return root;
}

bool ConsoleConfig::validate(QString *errorMessage) const
{
    if (display.displaySize.width < 1 || display.displaySize.height < 1) {
        setError(errorMessage, QStringLiteral("display size %1x%2 must be positive")
                                   .arg(display.displaySize.width)
                                   .arg(display.displaySize.height));
        return false;
    }
    if (display.frameInterval.count() < 1) {
        setError(errorMessage, QStringLiteral("display.frameIntervalMs must be at least 1"));
        return false;
    }
    if (statusLogCapacity < 1) {
        setError(errorMessage, QStringLiteral("statusLog.capacity must be at least 1"));
        return false;
    }
    for (int i = 0; i < CameraSourceManager::kSlotCount; ++i) {
        const QString backend = cameras[static_cast<size_t>(i)].backend;
        if (backend != QLatin1String("opencv") && backend != QLatin1String("vimba") && backend != QLatin1String("none")) {
            setError(errorMessage, QStringLiteral("cameras[%1].backend \"%2\" is not one of opencv, vimba, none")
                                       .arg(i)
                                       .arg(backend));
            return false;
        }
    }
    if (activeSource != -1 && !CameraSourceManager::isValidSource(activeSource)) {
        setError(errorMessage, QStringLiteral("activeSource %1 is outside -1..%2")
                                   .arg(activeSource)
                                   .arg(CameraSourceManager::kSlotCount - 1));
        return false;
    }
    if (calibration.maxAttemptsPerCell < 1) {
        setError(errorMessage, QStringLiteral("calibration.maxAttemptsPerCell must be at least 1"));
        return false;
    }
    if (calibration.maxGridDimension < 1 ||
        calibration.maxGridDimension > CalibrationSessionSettings::kGridDimensionLimit) {
        setError(errorMessage, QStringLiteral("calibration.maxGridDimension must be within 1..%1")
                                   .arg(CalibrationSessionSettings::kGridDimensionLimit));
        return false;
    }
    if (calibration.actuatorTimeout.count() < 0 || calibration.captureTimeout.count() < 0) {
        setError(errorMessage, QStringLiteral("calibration timeouts must not be negative"));
        return false;
    }
    if (targets.chessboard.cols < 2 || targets.chessboard.rows < 2 || targets.chessboard.squareMm <= 0.0) {
        setError(errorMessage, QStringLiteral("targets.chessboard needs at least 2x2 inner corners and a positive square size"));
        return false;
    }
    if (targets.circleGrid.cols < 2 || targets.circleGrid.rows < 2 || targets.circleGrid.spacingMm <= 0.0) {
        setError(errorMessage, QStringLiteral("targets.circleGrid needs at least 2x2 circles and a positive spacing"));
        return false;
    }
    if (!arucoDictionaryFromName(targets.aruco.dictionary, nullptr)) {
        setError(errorMessage, QStringLiteral("targets.aruco.dictionary \"%1\" is not a known dictionary")
                                   .arg(targets.aruco.dictionary));
        return false;
    }
    if (targets.aruco.markerId < 0 || targets.aruco.markerMm <= 0.0) {
        setError(errorMessage, QStringLiteral("targets.aruco needs a non-negative marker id and a positive size"));
        return false;
    }
    if (!recording.path.isEmpty() && !(recording.fps > 0.0)) {
        setError(errorMessage, QStringLiteral("recording.fps must be positive"));
        return false;
    }
    return true;
}

} // namespace pickcal
