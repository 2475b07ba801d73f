#ifndef EYEMAP_PNG_RENDERER_HPP
#define EYEMAP_PNG_RENDERER_HPP

#include <eyemap/coordinate_system.hpp>
#include <eyemap/layout_calculator.hpp>
#include <eyemap/result.hpp>
#include <eyemap/types.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace eyemap {

/**
 * 8-bit RGB raster, row-major, three bytes per pixel.
 */
struct RgbImage {
    int width = 0;
    int height = 0;
    std::vector<std::uint8_t> pixels;

    RgbImage(int w, int h, Color fill);

    Color at(int x, int y) const;
    void set(int x, int y, Color color);
};

/**
 * Rasterizes the same layout, legend and hexagons the SVG path uses and
 * encodes them with libpng. Tooltips have no raster form and are dropped.
 */
class PngRenderer {
public:
    // Largest raster side after scaling, in pixels
    static constexpr int MAX_RASTER_DIMENSION = 16384;

    PngRenderer(double scale, CoordinateSystem coordinates);

    RgbImage rasterize(const HexagonGrid& grid, const LayoutConfig& layout, const LegendConfig& legend) const;

    // Encoded PNG file bytes
    Result<std::string> render(const HexagonGrid& grid, const LayoutConfig& layout,
                               const LegendConfig& legend) const;

    static Result<std::string> encode(const RgbImage& image);

    static std::string base64_encode(const std::string& bytes);
    static std::string to_data_uri(const std::string& png_bytes);

    double scale() const { return scale_; }

private:
    double scale_;
    CoordinateSystem coordinates_;
};

} // namespace eyemap

#endif // EYEMAP_PNG_RENDERER_HPP
