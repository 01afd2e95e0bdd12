#pragma once

#include <QDateTime>
#include <QString>
#include <QtGlobal>

#include <chrono>
#include <memory>

#include <opencv2/core.hpp>

#include "pickcal/OperationResult.h"

namespace pickcal {

// A decoded frame. `image` is 8-bit BGR or 8-bit grayscale.
struct Frame {
    cv::Mat image;
    quint64 sequence {0};
    int sourceId {-1};
    QDateTime capturedAt;

    bool isValid() const { return !image.empty(); }
};

struct FrameResult {
    bool success {false};
    ErrorCode error {ErrorCode::None};
    QString message;
    Frame frame;
    // True when the frame is the last one already delivered because the
    // device was busy with another read.
    bool cached {false};
};

/**
 * One physical or virtual camera. Instances are owned by CameraSourceManager,
 * which serializes every call; implementations need no locking of their own
 * for open/close/read.
 */
class CameraDevice {
public:
    virtual ~CameraDevice() = default;

    virtual QString backendName() const = 0;
    virtual QString describe() const = 0;

    virtual bool open(QString *errorMessage) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Blocks at most `timeout`. Returns false with a message on failure.
    virtual bool read(cv::Mat &frame, std::chrono::milliseconds timeout, QString *errorMessage) = 0;
};

using CameraDevicePtr = std::unique_ptr<CameraDevice>;

} // namespace pickcal
