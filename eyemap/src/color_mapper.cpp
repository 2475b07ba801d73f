#include <eyemap/color_mapper.hpp>
#include <eyemap/color_palette.hpp>
#include <algorithm>
#include <cmath>

namespace eyemap {

namespace {

std::uint8_t lerp_channel(std::uint8_t a, std::uint8_t b, double t) {
    const double v = static_cast<double>(a) + (static_cast<double>(b) - static_cast<double>(a)) * t;
    return static_cast<std::uint8_t>(std::lround(std::clamp(v, 0.0, 255.0)));
}

} // namespace

ColorMapper::ColorMapper()
    : gradient_(colors::GRADIENT.begin(), colors::GRADIENT.end()) {}

ColorMapper::ColorMapper(std::vector<Color> gradient)
    : gradient_(std::move(gradient)) {
    if (gradient_.empty()) {
        gradient_.assign(colors::GRADIENT.begin(), colors::GRADIENT.end());
    }
}

double ColorMapper::interpolation_factor(double value, double min_value, double max_value) const {
    const double t = (value - min_value) / (max_value - min_value);
    if (std::isnan(t)) return 0.0;
    return std::clamp(t, 0.0, 1.0);
}

Color ColorMapper::map_value_to_color(double value, double min_value, double max_value) const {
    return color_at(interpolation_factor(value, min_value, max_value));
}

Color ColorMapper::color_at(double t) const {
    if (gradient_.size() == 1) return gradient_.front();

    t = std::clamp(t, 0.0, 1.0);
    const double scaled = t * static_cast<double>(gradient_.size() - 1);
    const std::size_t lower = std::min(static_cast<std::size_t>(std::floor(scaled)), gradient_.size() - 2);
    const double local = scaled - static_cast<double>(lower);

    const Color& a = gradient_[lower];
    const Color& b = gradient_[lower + 1];
    return Color{lerp_channel(a.r, b.r, local), lerp_channel(a.g, b.g, local), lerp_channel(a.b, b.b, local)};
}

Color ColorMapper::no_data_color() {
    return colors::WHITE;
}

Color ColorMapper::not_in_region_color() {
    return colors::DARK_GRAY;
}

Color ColorMapper::status_color(ColumnStatus status) {
    return status == ColumnStatus::NotInRegion ? not_in_region_color() : no_data_color();
}

} // namespace eyemap
