#include "pickcal/camera/Utils.h"

#include <opencv2/imgproc.hpp>

#include <algorithm>

namespace pickcal {

cv::Mat Utils::toBgr(const cv::Mat& frame) {
    if (frame.empty()) {
        return {};
    }

    cv::Mat eightBit = frame;
    if (frame.depth() == CV_16U) {
        frame.convertTo(eightBit, CV_8U, 1.0 / 256.0);
    } else if (frame.depth() != CV_8U) {
        frame.convertTo(eightBit, CV_8U);
    }

    cv::Mat bgr;
    switch (eightBit.channels()) {
    case 1:
        cv::cvtColor(eightBit, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 4:
        cv::cvtColor(eightBit, bgr, cv::COLOR_BGRA2BGR);
        break;
    default:
        bgr = eightBit;
        break;
    }
    return bgr;
}

QImage Utils::matToDisplayImage(const cv::Mat& frame, const cv::Size& displaySize) {
    const cv::Mat bgr = toBgr(frame);
    if (bgr.empty() || bgr.channels() != 3 || displaySize.width <= 0 || displaySize.height <= 0) {
        return {};
    }

    cv::Mat scaled = bgr;
    if (bgr.size() != displaySize) {
        const int interpolation = bgr.cols > displaySize.width ? cv::INTER_AREA : cv::INTER_LINEAR;
        cv::resize(bgr, scaled, displaySize, 0.0, 0.0, interpolation);
    }

    cv::Mat rgba;
    cv::cvtColor(scaled, rgba, cv::COLOR_BGR2RGBA);
    return QImage(rgba.data, rgba.cols, rgba.rows, static_cast<int>(rgba.step), QImage::Format_RGBA8888).copy();
}

QImage Utils::makePlaceholderImage(const cv::Size& displaySize, const QString& label) {
    const int width = std::max(1, displaySize.width);
    const int height = std::max(1, displaySize.height);
    cv::Mat card(height, width, CV_8UC3, cv::Scalar(40, 40, 40));

    const cv::Scalar lineColor(70, 70, 70);
    cv::line(card, cv::Point(0, 0), cv::Point(width - 1, height - 1), lineColor, 2, cv::LINE_AA);
    cv::line(card, cv::Point(width - 1, 0), cv::Point(0, height - 1), lineColor, 2, cv::LINE_AA);
    cv::rectangle(card, cv::Rect(0, 0, width, height), cv::Scalar(90, 90, 90), 2);

    const std::string text = label.toStdString();
    const int font = cv::FONT_HERSHEY_SIMPLEX;
    const double scale = std::max(0.4, width / 640.0 * 1.5);
    const int thickness = std::max(1, static_cast<int>(scale * 2.0));
    int baseline = 0;
    const cv::Size textSize = cv::getTextSize(text, font, scale, thickness, &baseline);
    const cv::Point origin((width - textSize.width) / 2, (height + textSize.height) / 2);
    cv::rectangle(card,
                  cv::Rect(origin.x - 12, origin.y - textSize.height - 12,
                           textSize.width + 24, textSize.height + baseline + 24),
                  cv::Scalar(20, 20, 20), cv::FILLED);
    cv::putText(card, text, origin, font, scale, cv::Scalar(220, 220, 220), thickness, cv::LINE_AA);

    return matToDisplayImage(card, cv::Size(width, height));
}

} // namespace pickcal
