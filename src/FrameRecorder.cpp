#include "pickcal/FrameRecorder.h"

#include <opencv2/imgproc.hpp>

#include "pickcal/Logger.h"
#include "pickcal/camera/Utils.h"

namespace pickcal {

FrameRecorder::FrameRecorder(const QString &path, double fps)
    : m_path(path)
    , m_fps(fps > 0.0 ? fps : 30.0)
{
}

FrameRecorder::~FrameRecorder()
{
    close();
}

bool FrameRecorder::openFor(const cv::Size &size)
{
    try {
        const bool avi = m_path.endsWith(QLatin1String(".avi"), Qt::CaseInsensitive);
        const int fourcc = avi ? cv::VideoWriter::fourcc('M', 'J', 'P', 'G') : cv::VideoWriter::fourcc('m', 'p', '4', 'v');
        if (!m_writer.open(m_path.toStdString(), fourcc, m_fps, size, true)) {
            Logger::error(QStringLiteral("Unable to open recording file %1").arg(m_path));
            m_failed = true;
            return false;
        }
    } catch (const cv::Exception &ex) {
        Logger::error(QStringLiteral("Unable to open recording file %1: %2")
                          .arg(m_path, QString::fromStdString(ex.what())));
        m_failed = true;
        return false;
    }
    m_size = size;
    Logger::info(QStringLiteral("Recording %1x%2 @ %3 fps to %4")
                     .arg(size.width)
                     .arg(size.height)
                     .arg(m_fps, 0, 'f', 1)
                     .arg(m_path));
    return true;
}

bool FrameRecorder::write(const cv::Mat &frame)
{
    if (m_failed || frame.empty()) {
        return false;
    }
    if (!m_writer.isOpened() && !openFor(frame.size())) {
        return false;
    }

    try {
        cv::Mat bgr = Utils::toBgr(frame);
        if (bgr.size() != m_size) {
            cv::resize(bgr, bgr, m_size);
        }
        m_writer.write(bgr);
    } catch (const cv::Exception &ex) {
        Logger::error(QStringLiteral("Recording to %1 stopped: %2").arg(m_path, QString::fromStdString(ex.what())));
        m_failed = true;
        close();
        return false;
    }
    ++m_framesWritten;
    return true;
}

void FrameRecorder::close()
{
    if (m_writer.isOpened()) {
        m_writer.release();
        Logger::info(QStringLiteral("Recording closed: %1 frames written to %2").arg(m_framesWritten).arg(m_path));
    }
}

} // namespace pickcal
