#include "pickcal/FramePump.h"

#include <exception>
#include <utility>

#include "pickcal/FrameRecorder.h"
#include "pickcal/Logger.h"
#include "pickcal/camera/CameraSourceManager.h"
#include "pickcal/camera/Utils.h"

namespace pickcal {

FramePump::FramePump(CameraSourceManager &cameras, const FramePumpSettings &settings)
    : m_cameras(cameras)
    , m_settings(settings)
{
    m_placeholder = Utils::makePlaceholderImage(m_settings.displaySize, QStringLiteral("NO SIGNAL"));
}

FramePump::~FramePump() = default;

void FramePump::setRecorder(std::unique_ptr<FrameRecorder> recorder)
{
    std::lock_guard<std::mutex> lock(m_recorderMutex);
    m_recorder = std::move(recorder);
    m_lastRecordedSequence = 0;
}

QImage FramePump::render(qint64 frameIndex)
{
    m_lastFrameIndex.store(frameIndex);

    const FrameResult result = m_cameras.captureFrame(m_settings.frameInterval);
    if (!result.success || !result.frame.isValid()) {
        return renderPlaceholder();
    }

    QImage image;
    try {
        image = Utils::matToDisplayImage(result.frame.image, m_settings.displaySize);
    } catch (const cv::Exception &ex) {
        Logger::warning(QStringLiteral("Frame %1 could not be converted: %2")
                            .arg(frameIndex)
                            .arg(QString::fromStdString(ex.what())));
    }
    if (image.isNull()) {
        return renderPlaceholder();
    }

    if (!result.cached) {
        record(result.frame.image, result.frame.sequence);
    }
    ++m_framesRendered;
    return image;
}

QImage FramePump::renderPlaceholder()
{
    ++m_placeholdersRendered;
    return m_placeholder;
}

void FramePump::record(const cv::Mat &frame, quint64 sequence)
{
    std::lock_guard<std::mutex> lock(m_recorderMutex);
    if (!m_recorder || m_recorder->hasFailed() || sequence <= m_lastRecordedSequence) {
        return;
    }
    m_lastRecordedSequence = sequence;
    if (!m_recorder->write(frame) && m_recorder->hasFailed()) {
        Logger::warning(QStringLiteral("Recording to %1 disabled").arg(m_recorder->path()));
    }
}

} // namespace pickcal
