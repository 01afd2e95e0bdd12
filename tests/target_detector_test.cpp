#include "pickcal/TargetDetector.h"
#include "gtest/gtest.h"

#include <opencv2/imgproc.hpp>
#include <opencv2/objdetect/aruco_detector.hpp>

using namespace pickcal;

namespace {

constexpr int kSquarePx = 40;
constexpr int kMarginPx = 60;

// 10x7 squares, i.e. the default 9x6 inner corners.
cv::Mat syntheticChessboard()
{
    const int squaresX = 10;
    const int squaresY = 7;
    cv::Mat image(squaresY * kSquarePx + 2 * kMarginPx, squaresX * kSquarePx + 2 * kMarginPx, CV_8UC3,
                  cv::Scalar(255, 255, 255));
    for (int r = 0; r < squaresY; ++r) {
        for (int c = 0; c < squaresX; ++c) {
            if ((r + c) % 2 == 0) {
                cv::rectangle(image,
                              cv::Rect(kMarginPx + c * kSquarePx, kMarginPx + r * kSquarePx, kSquarePx, kSquarePx),
                              cv::Scalar(0, 0, 0), cv::FILLED);
            }
        }
    }
    return image;
}

cv::Mat syntheticCircleGrid(const CircleGridSpec &grid)
{
    const int spacing = 30;
    const int margin = 50;
    cv::Mat image((grid.rows - 1) * spacing + 2 * margin, (2 * grid.cols) * spacing + 2 * margin, CV_8UC1,
                  cv::Scalar(255));
    for (int r = 0; r < grid.rows; ++r) {
        for (int c = 0; c < grid.cols; ++c) {
            const cv::Point center(margin + (2 * c + r % 2) * spacing, margin + r * spacing);
            cv::circle(image, center, 9, cv::Scalar(0), cv::FILLED, cv::LINE_AA);
        }
    }
    return image;
}

} // namespace

class TargetDetectorTest : public ::testing::Test {
protected:
    TargetSpec spec;
    OpenCvTargetDetector detector {spec};
};

TEST_F(TargetDetectorTest, FindsSyntheticChessboard)
{
    const auto result = detector.detect(syntheticChessboard(), CalibrationTarget::Chessboard);
    ASSERT_TRUE(result.success) << result.message.toStdString();
    EXPECT_EQ(result.imagePoints.size(), 54u);
    EXPECT_EQ(result.objectPoints.size(), 54u);
    EXPECT_EQ(result.resolution, cv::Size(520, 400));

    // Inner corners span columns 1..9 and rows 1..6 of the square lattice.
    EXPECT_NEAR(result.referencePoint.x, kMarginPx + 5.0 * kSquarePx, 1.0);
    EXPECT_NEAR(result.referencePoint.y, kMarginPx + 3.5 * kSquarePx, 1.0);
}

TEST_F(TargetDetectorTest, BlankFrameIsNotAChessboard)
{
    const cv::Mat blank(480, 640, CV_8UC3, cv::Scalar(128, 128, 128));
    const auto result = detector.detect(blank, CalibrationTarget::Chessboard);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.message.contains(QStringLiteral("9x6")));
}

TEST_F(TargetDetectorTest, EmptyFrameFails)
{
    const auto result = detector.detect(cv::Mat(), CalibrationTarget::ArucoMarker);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.message.isEmpty());
}

TEST_F(TargetDetectorTest, FindsAsymmetricCircleGrid)
{
    const auto result = detector.detect(syntheticCircleGrid(spec.circleGrid), CalibrationTarget::CircleGrid);
    ASSERT_TRUE(result.success) << result.message.toStdString();
    EXPECT_EQ(result.imagePoints.size(), static_cast<size_t>(spec.circleGrid.cols * spec.circleGrid.rows));
    EXPECT_EQ(result.objectPoints.size(), result.imagePoints.size());
}

TEST_F(TargetDetectorTest, FindsConfiguredArucoMarker)
{
    cv::Mat marker;
    cv::aruco::generateImageMarker(cv::aruco::getPredefinedDictionary(cv::aruco::DICT_4X4_50), 0, 200, marker, 1);
    cv::Mat canvas(400, 400, CV_8UC1, cv::Scalar(255));
    marker.copyTo(canvas(cv::Rect(100, 100, 200, 200)));

    const auto result = detector.detect(canvas, CalibrationTarget::ArucoMarker);
    ASSERT_TRUE(result.success) << result.message.toStdString();
    EXPECT_EQ(result.imagePoints.size(), 4u);
    EXPECT_NEAR(result.referencePoint.x, 200.0, 1.5);
    EXPECT_NEAR(result.referencePoint.y, 200.0, 1.5);
}

TEST_F(TargetDetectorTest, OtherMarkerIdIsNotAccepted)
{
    cv::Mat marker;
    cv::aruco::generateImageMarker(cv::aruco::getPredefinedDictionary(cv::aruco::DICT_4X4_50), 7, 200, marker, 1);
    cv::Mat canvas(400, 400, CV_8UC1, cv::Scalar(255));
    marker.copyTo(canvas(cv::Rect(100, 100, 200, 200)));

    const auto result = detector.detect(canvas, CalibrationTarget::ArucoMarker);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.message.contains(QStringLiteral("not in view")));
}

TEST(ArucoDictionaryTest, ResolvesKnownNames)
{
    int id = -1;
    EXPECT_TRUE(arucoDictionaryFromName(QStringLiteral("DICT_4X4_50"), &id));
    EXPECT_EQ(id, cv::aruco::DICT_4X4_50);
    EXPECT_TRUE(arucoDictionaryFromName(QStringLiteral(" dict_apriltag_36h11 "), &id));
    EXPECT_EQ(id, cv::aruco::DICT_APRILTAG_36h11);
    EXPECT_FALSE(arucoDictionaryFromName(QStringLiteral("DICT_9X9_1"), &id));
}
