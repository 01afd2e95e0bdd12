#pragma once

#include <QImage>
#include <QtGlobal>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>

#include <opencv2/core.hpp>

namespace pickcal {

class CameraSourceManager;
class FrameRecorder;

struct FramePumpSettings {
    cv::Size displaySize {640, 480};
    std::chrono::milliseconds frameInterval {33};
};

/**
 * Serves the viewport's per-tick render callback. render() waits at most one
 * frame interval for the active camera and otherwise returns the cached frame
 * or the fixed placeholder card, so the caller never has to handle absence of
 * video.
 */
class FramePump {
public:
    FramePump(CameraSourceManager &cameras, const FramePumpSettings &settings);
    ~FramePump();

    QImage render(qint64 frameIndex);

    const QImage &placeholder() const { return m_placeholder; }
    const FramePumpSettings &settings() const { return m_settings; }

    void setRecorder(std::unique_ptr<FrameRecorder> recorder);

    qint64 lastFrameIndex() const { return m_lastFrameIndex.load(); }
    quint64 framesRendered() const { return m_framesRendered.load(); }
    quint64 placeholdersRendered() const { return m_placeholdersRendered.load(); }

private:
    QImage renderPlaceholder();
    void record(const cv::Mat &frame, quint64 sequence);

    CameraSourceManager &m_cameras;
    FramePumpSettings m_settings;
    QImage m_placeholder;

    std::mutex m_recorderMutex;
    std::unique_ptr<FrameRecorder> m_recorder;
    quint64 m_lastRecordedSequence {0};

    std::atomic<qint64> m_lastFrameIndex {-1};
    std::atomic<quint64> m_framesRendered {0};
    std::atomic<quint64> m_placeholdersRendered {0};
};

} // namespace pickcal
