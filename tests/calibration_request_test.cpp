#include "pickcal/CalibrationRequest.h"
#include "gtest/gtest.h"

#include <QLocale>

using namespace pickcal;

TEST(LocationParsingTest, AcceptsPlainDecimals)
{
    EXPECT_DOUBLE_EQ(parseLocationValue(QStringLiteral("12.5")).value(), 12.5);
    EXPECT_DOUBLE_EQ(parseLocationValue(QStringLiteral("-3")).value(), -3.0);
    EXPECT_DOUBLE_EQ(parseLocationValue(QStringLiteral("0")).value(), 0.0);
    EXPECT_DOUBLE_EQ(parseLocationValue(QStringLiteral("1e2")).value(), 100.0);
}

TEST(LocationParsingTest, IgnoresSurroundingWhitespace)
{
    EXPECT_DOUBLE_EQ(parseLocationValue(QStringLiteral("  42.25 \t")).value(), 42.25);
}

TEST(LocationParsingTest, RejectsNonNumbers)
{
    EXPECT_FALSE(parseLocationValue(QStringLiteral("abc")).has_value());
    EXPECT_FALSE(parseLocationValue(QString()).has_value());
    EXPECT_FALSE(parseLocationValue(QStringLiteral("   ")).has_value());
    EXPECT_FALSE(parseLocationValue(QStringLiteral("12mm")).has_value());
    EXPECT_FALSE(parseLocationValue(QStringLiteral("1,000")).has_value());
    EXPECT_FALSE(parseLocationValue(QStringLiteral("inf")).has_value());
    EXPECT_FALSE(parseLocationValue(QStringLiteral("nan")).has_value());
}

TEST(LocationParsingTest, IndependentOfDefaultLocale)
{
    const QLocale previous;
    QLocale::setDefault(QLocale(QLocale::German, QLocale::Germany));
    const auto dotted = parseLocationValue(QStringLiteral("1.5"));
    const auto comma = parseLocationValue(QStringLiteral("1,5"));
    QLocale::setDefault(previous);

    ASSERT_TRUE(dotted.has_value());
    EXPECT_DOUBLE_EQ(*dotted, 1.5);
    EXPECT_FALSE(comma.has_value());
}

TEST(LocationParsingTest, ReportsTheOffendingField)
{
    CalibrationRequest request;
    request.locX = QStringLiteral("10");
    request.locY = QStringLiteral("abc");

    cv::Point2d location;
    QString error;
    EXPECT_FALSE(parseLocation(request, &location, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("loc_y")));
    EXPECT_TRUE(error.contains(QStringLiteral("abc")));

    request.locY = QStringLiteral("-7.5");
    ASSERT_TRUE(parseLocation(request, &location, &error));
    EXPECT_DOUBLE_EQ(location.x, 10.0);
    EXPECT_DOUBLE_EQ(location.y, -7.5);
}

TEST(CalibrationTargetTest, MapsConsoleTargetIds)
{
    EXPECT_EQ(calibrationTargetFromId(0), CalibrationTarget::Chessboard);
    EXPECT_EQ(calibrationTargetFromId(1), CalibrationTarget::CircleGrid);
    EXPECT_EQ(calibrationTargetFromId(2), CalibrationTarget::ArucoMarker);
    EXPECT_FALSE(calibrationTargetFromId(3).has_value());
    EXPECT_FALSE(calibrationTargetFromId(-1).has_value());
}
