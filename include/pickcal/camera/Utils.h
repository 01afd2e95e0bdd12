#pragma once
#include <QImage>
#include <QString>

#include <opencv2/core.hpp>

namespace pickcal {
namespace Utils
{
// Converts an 8/16-bit gray, BGR or BGRA matrix to an RGBA8888 image of
// exactly `displaySize`. Returns a null image when the input is empty.
QImage matToDisplayImage(const cv::Mat& frame, const cv::Size& displaySize);

// Fixed "no signal" card shown when no live frame is available.
QImage makePlaceholderImage(const cv::Size& displaySize, const QString& label);

cv::Mat toBgr(const cv::Mat& frame);
}
} // namespace pickcal
