#pragma once

#include <QString>

#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

namespace pickcal {

// Appends live frames to a video file: MJPG for .avi paths, mp4v otherwise.
// The writer is opened on the first frame because the output size is only
// known then.
class FrameRecorder {
public:
    FrameRecorder(const QString &path, double fps);
    ~FrameRecorder();

    bool write(const cv::Mat &frame);
    void close();

    bool isOpen() const { return m_writer.isOpened(); }
    bool hasFailed() const { return m_failed; }
    QString path() const { return m_path; }
    long long framesWritten() const { return m_framesWritten; }

private:
    bool openFor(const cv::Size &size);

    QString m_path;
    double m_fps {30.0};
    cv::VideoWriter m_writer;
    cv::Size m_size;
    long long m_framesWritten {0};
    bool m_failed {false};
};

} // namespace pickcal
