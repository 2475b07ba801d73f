#ifndef EYEMAP_LAYOUT_CALCULATOR_HPP
#define EYEMAP_LAYOUT_CALCULATOR_HPP

#include <eyemap/color_mapper.hpp>
#include <eyemap/result.hpp>
#include <eyemap/types.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace eyemap {

struct EyemapConfig;

/**
 * Canvas geometry derived from the hexagon bounding box.
 * Hexagon pixel coordinates are shifted by (offset_x, offset_y).
 */
struct LayoutConfig {
    int width = 0;
    int height = 0;
    double offset_x = 0.0;
    double offset_y = 0.0;
    double margin = 0.0;
    double hex_size = 0.0;

    double title_x = 0.0;
    double title_y = 0.0;
    double subtitle_y = 0.0;

    double legend_x = 0.0;
    double legend_y = 0.0;
    double legend_width = 0.0;
    double legend_height = 0.0;
    double legend_title_x = 0.0;
    double legend_title_y = 0.0;
};

struct LegendSwatch {
    double y = 0.0;        // Absolute top of the swatch
    double height = 0.0;
    Color color;
};

struct LegendTick {
    double value = 0.0;
    double y = 0.0;        // Absolute position on the legend axis
    std::string label;
};

/**
 * Color ramp and tick labels; built from the same ValueRange used to
 * color the hexagons.
 */
struct LegendConfig {
    std::string title;
    ValueRange value_range;
    std::vector<LegendSwatch> swatches;   // Bottom (low) to top (high)
    std::vector<LegendTick> ticks;        // Ascending values
};

class LayoutCalculator {
public:
    // Largest canvas side accepted, in pixels
    static constexpr double MAX_CANVAS_DIMENSION = 16384.0;

    LayoutCalculator(double hex_size, double margin, double legend_width, double legend_height,
                     double title_height, std::size_t legend_ticks);
    explicit LayoutCalculator(const EyemapConfig& config);

    Result<LayoutConfig> calculate_layout(const std::vector<HexagonDescriptor>& hexagons) const;

    LegendConfig calculate_legend(const LayoutConfig& layout, const ValueRange& range,
                                  MetricType metric, const ColorMapper& mapper) const;

    static const char* legend_title(MetricType metric);

    // Up to two decimals, trailing zeros trimmed
    static std::string format_tick(double value);

private:
    double hex_size_;
    double margin_;
    double legend_width_;
    double legend_height_;
    double title_height_;
    std::size_t legend_ticks_;
};

} // namespace eyemap

#endif // EYEMAP_LAYOUT_CALCULATOR_HPP
