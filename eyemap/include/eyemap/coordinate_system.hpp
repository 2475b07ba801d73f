#ifndef EYEMAP_COORDINATE_SYSTEM_HPP
#define EYEMAP_COORDINATE_SYSTEM_HPP

#include <eyemap/result.hpp>
#include <eyemap/types.hpp>
#include <array>
#include <vector>

namespace eyemap {

struct PixelPoint {
    double x = 0.0;
    double y = 0.0;
};

struct CoordinateRanges {
    int min_hex1 = 0;
    int min_hex2 = 0;
};

/**
 * Axial lattice -> pixel transform for flat-topped hexagons.
 *
 *   q = hex2 - hex1, r = -hex2
 *   x = s * 3/2 * q
 *   y = s * (sqrt(3)/2 * q + sqrt(3) * r)      with s = hex_size * spacing_factor
 *
 * Mirroring negates x. Pure: identical inputs give bit-identical outputs.
 */
class CoordinateSystem {
public:
    CoordinateSystem(double hex_size, double spacing_factor);

    PixelPoint to_pixel(int hex1, int hex2, bool mirror) const;

    // Right-hemisphere grids are mirrored so both sides read anatomically
    static bool mirror_for(Hemisphere side) { return side == Hemisphere::Right; }

    // Six vertices of the hexagon centered at (cx, cy), starting at angle 0
    std::array<PixelPoint, 6> hexagon_points(double cx, double cy) const;
    std::array<PixelPoint, 6> hexagon_points(double cx, double cy, double radius) const;

    Result<CoordinateRanges> coordinate_ranges(const std::vector<PossibleColumn>& columns) const;

    double hex_size() const { return hex_size_; }
    double spacing_factor() const { return spacing_factor_; }

private:
    double hex_size_;
    double spacing_factor_;
};

} // namespace eyemap

#endif // EYEMAP_COORDINATE_SYSTEM_HPP
