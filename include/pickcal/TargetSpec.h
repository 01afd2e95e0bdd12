#pragma once

#include <QString>

#include <vector>

#include <opencv2/core.hpp>

namespace pickcal {

struct ChessboardSpec {
    int cols {9}; // inner corners per row
    int rows {6}; // inner corners per column
    double squareMm {25.0};

    [[nodiscard]] cv::Size patternSize() const { return {cols, rows}; }
    [[nodiscard]] std::vector<cv::Point3f> buildObjectPoints() const;
};

struct CircleGridSpec {
    int cols {4};
    int rows {11};
    double spacingMm {20.0};
    bool asymmetric {true};

    [[nodiscard]] cv::Size patternSize() const { return {cols, rows}; }
    [[nodiscard]] std::vector<cv::Point3f> buildObjectPoints() const;
};

struct ArucoSpec {
    QString dictionary {QStringLiteral("DICT_4X4_50")};
    int markerId {0};
    double markerMm {40.0};
};

// Geometry of the physical targets the robot carries.
struct TargetSpec {
    ChessboardSpec chessboard;
    CircleGridSpec circleGrid;
    ArucoSpec aruco;
};

inline std::vector<cv::Point3f> ChessboardSpec::buildObjectPoints() const
{
    std::vector<cv::Point3f> coords;
    coords.reserve(static_cast<size_t>(cols * rows));
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            coords.emplace_back(static_cast<float>(col * squareMm), static_cast<float>(row * squareMm), 0.0f);
        }
    }
    return coords;
}

inline std::vector<cv::Point3f> CircleGridSpec::buildObjectPoints() const
{
    std::vector<cv::Point3f> coords;
    coords.reserve(static_cast<size_t>(cols * rows));
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            // Asymmetric grids offset every other row by half a pitch.
            const double x = asymmetric ? (2 * col + row % 2) * spacingMm : col * spacingMm;
            coords.emplace_back(static_cast<float>(x), static_cast<float>(row * spacingMm), 0.0f);
        }
    }
    return coords;
}

} // namespace pickcal
