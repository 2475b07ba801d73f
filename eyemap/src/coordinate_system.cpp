#include <eyemap/coordinate_system.hpp>
#include <algorithm>
#include <cmath>

namespace eyemap {

namespace {
constexpr double SQRT3 = 1.7320508075688772;
constexpr double PI = 3.14159265358979323846;
}

CoordinateSystem::CoordinateSystem(double hex_size, double spacing_factor)
    : hex_size_(hex_size), spacing_factor_(spacing_factor) {}

PixelPoint CoordinateSystem::to_pixel(int hex1, int hex2, bool mirror) const {
    const double q = static_cast<double>(hex2 - hex1);
    const double r = static_cast<double>(-hex2);
    const double s = hex_size_ * spacing_factor_;

    PixelPoint p;
    p.x = s * 1.5 * q;
    p.y = s * (SQRT3 / 2.0 * q + SQRT3 * r);
    if (mirror) {
        p.x = -p.x;
    }
    return p;
}

std::array<PixelPoint, 6> CoordinateSystem::hexagon_points(double cx, double cy) const {
    return hexagon_points(cx, cy, hex_size_);
}

std::array<PixelPoint, 6> CoordinateSystem::hexagon_points(double cx, double cy, double radius) const {
    std::array<PixelPoint, 6> points;
    for (int i = 0; i < 6; ++i) {
        const double angle = PI / 3.0 * i;
        points[i].x = cx + radius * std::cos(angle);
        points[i].y = cy + radius * std::sin(angle);
    }
    return points;
}

Result<CoordinateRanges> CoordinateSystem::coordinate_ranges(const std::vector<PossibleColumn>& columns) const {
    if (columns.empty()) {
        return make_error(ErrorKind::DataProcessing,
                          "cannot calculate coordinate ranges from an empty column list",
                          "coordinate_range_calculation");
    }

    CoordinateRanges ranges{columns.front().hex1, columns.front().hex2};
    for (const auto& column : columns) {
        ranges.min_hex1 = std::min(ranges.min_hex1, column.hex1);
        ranges.min_hex2 = std::min(ranges.min_hex2, column.hex2);
    }
    return ranges;
}

} // namespace eyemap
