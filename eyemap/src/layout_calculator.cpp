#include <eyemap/config.hpp>
#include <eyemap/layout_calculator.hpp>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace eyemap {

namespace {
constexpr double TITLE_BASELINE = 12.0;
constexpr double SUBTITLE_BASELINE = 28.0;
constexpr double LEGEND_TITLE_GAP = 4.0;
}

LayoutCalculator::LayoutCalculator(double hex_size, double margin, double legend_width, double legend_height,
                                   double title_height, std::size_t legend_ticks)
    : hex_size_(hex_size)
    , margin_(margin)
    , legend_width_(legend_width)
    , legend_height_(legend_height)
    , title_height_(title_height)
    , legend_ticks_(std::max<std::size_t>(legend_ticks, 2)) {}

LayoutCalculator::LayoutCalculator(const EyemapConfig& config)
    : LayoutCalculator(config.hex_size, config.margin, config.legend_width, config.legend_height,
                       config.title_height, config.legend_ticks) {}

Result<LayoutConfig> LayoutCalculator::calculate_layout(const std::vector<HexagonDescriptor>& hexagons) const {
    const char* op = "layout_calculation";

    if (hexagons.empty()) {
        return make_error(ErrorKind::Rendering, "cannot lay out an empty hexagon list", op);
    }

    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();
    for (const auto& h : hexagons) {
        min_x = std::min(min_x, h.pixel_x);
        min_y = std::min(min_y, h.pixel_y);
        max_x = std::max(max_x, h.pixel_x);
        max_y = std::max(max_y, h.pixel_y);
    }
    min_x -= hex_size_;
    min_y -= hex_size_;
    max_x += hex_size_;
    max_y += hex_size_;

    const double box_w = max_x - min_x;
    const double box_h = max_y - min_y;
    if (!std::isfinite(box_w) || !std::isfinite(box_h) || !(box_w > 0.0) || !(box_h > 0.0)) {
        Error e = make_error(ErrorKind::Rendering, "degenerate canvas bounding box", op);
        e.field = "bounding_box";
        e.value = std::to_string(box_w) + "x" + std::to_string(box_h);
        return e;
    }

    const double width = std::ceil(box_w + legend_width_ + 7.0 * margin_);
    const double height = std::ceil(std::max(box_h, legend_height_) + 2.0 * margin_ + title_height_);
    if (!(width <= MAX_CANVAS_DIMENSION) || !(height <= MAX_CANVAS_DIMENSION)) {
        Error e = make_error(ErrorKind::Rendering, "canvas exceeds the maximum size", op);
        e.field = "canvas";
        e.value = std::to_string(width) + "x" + std::to_string(height);
        return e;
    }

    LayoutConfig layout;
    layout.margin = margin_;
    layout.hex_size = hex_size_;
    layout.width = static_cast<int>(width);
    layout.height = static_cast<int>(height);
    layout.offset_x = margin_ - min_x;
    layout.offset_y = title_height_ + margin_ - min_y;

    layout.title_x = margin_;
    layout.title_y = margin_ + TITLE_BASELINE;
    layout.subtitle_y = margin_ + SUBTITLE_BASELINE;

    layout.legend_x = 2.0 * margin_ + box_w;
    layout.legend_y = title_height_ + margin_;
    layout.legend_width = legend_width_;
    layout.legend_height = legend_height_;
    layout.legend_title_x = layout.legend_x;
    layout.legend_title_y = layout.legend_y - LEGEND_TITLE_GAP;
    return layout;
}

LegendConfig LayoutCalculator::calculate_legend(const LayoutConfig& layout, const ValueRange& range,
                                                MetricType metric, const ColorMapper& mapper) const {
    LegendConfig legend;
    legend.title = legend_title(metric);
    legend.value_range = range;

    const std::size_t intervals = legend_ticks_ - 1;
    const double span = range.max_value - range.min_value;
    const double bottom = layout.legend_y + layout.legend_height;
    const double step_h = layout.legend_height / static_cast<double>(intervals);

    legend.ticks.reserve(legend_ticks_);
    for (std::size_t i = 0; i < legend_ticks_; ++i) {
        const double fraction = static_cast<double>(i) / static_cast<double>(intervals);
        LegendTick tick;
        tick.value = range.min_value + span * fraction;
        tick.y = bottom - layout.legend_height * fraction;
        tick.label = format_tick(tick.value);
        legend.ticks.push_back(std::move(tick));
    }

    legend.swatches.reserve(intervals);
    for (std::size_t i = 0; i < intervals; ++i) {
        const double mid = 0.5 * (legend.ticks[i].value + legend.ticks[i + 1].value);
        LegendSwatch swatch;
        swatch.y = legend.ticks[i + 1].y;
        swatch.height = step_h;
        swatch.color = mapper.map_value_to_color(mid, range);
        legend.swatches.push_back(swatch);
    }
    return legend;
}

const char* LayoutCalculator::legend_title(MetricType metric) {
    return metric == MetricType::SynapseDensity ? "Total Synapses" : "Cell Count";
}

std::string LayoutCalculator::format_tick(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    std::string text = buffer;
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') text.pop_back();
        if (!text.empty() && text.back() == '.') text.pop_back();
    }
    if (text == "-0") text = "0";
    return text;
}

} // namespace eyemap
