#ifndef EYEMAP_COLOR_MAPPER_HPP
#define EYEMAP_COLOR_MAPPER_HPP

#include <eyemap/types.hpp>
#include <vector>

namespace eyemap {

/**
 * Maps scalar values onto the palette gradient.
 *
 * The caller guarantees min_value < max_value (ValueRange is epsilon-expanded
 * upstream); the mapper does not guard the division.
 */
class ColorMapper {
public:
    ColorMapper();
    explicit ColorMapper(std::vector<Color> gradient);

    // clamp((value - min) / (max - min), 0, 1)
    double interpolation_factor(double value, double min_value, double max_value) const;

    Color map_value_to_color(double value, double min_value, double max_value) const;
    Color map_value_to_color(double value, const ValueRange& range) const {
        return map_value_to_color(value, range.min_value, range.max_value);
    }

    // Color at a normalized position in [0, 1]
    Color color_at(double t) const;

    // Fixed colors for the non-data statuses
    static Color no_data_color();
    static Color not_in_region_color();
    static Color status_color(ColumnStatus status);

    const std::vector<Color>& gradient() const { return gradient_; }

private:
    std::vector<Color> gradient_;
};

} // namespace eyemap

#endif // EYEMAP_COLOR_MAPPER_HPP
