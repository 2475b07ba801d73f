#include <eyemap/color_palette.hpp>
#include <eyemap/log.hpp>
#include <eyemap/svg_renderer.hpp>
#include <cstdio>

namespace eyemap {

namespace {
constexpr double TICK_LENGTH = 3.0;
constexpr double TICK_LABEL_GAP = 2.0;
constexpr double TICK_LABEL_BASELINE = 2.5;
}

SvgRenderer::SvgRenderer(std::string template_path, CoordinateSystem coordinates)
    : template_path_(std::move(template_path)), coordinates_(coordinates) {}

std::string SvgRenderer::format_number(double value) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

std::string SvgRenderer::points_string(const std::array<PixelPoint, 6>& points) {
    std::string out;
    for (std::size_t i = 0; i < points.size(); ++i) {
        if (i > 0) out += ' ';
        out += format_number(points[i].x);
        out += ',';
        out += format_number(points[i].y);
    }
    return out;
}

const char* SvgRenderer::status_class(ColumnStatus status) {
    switch (status) {
        case ColumnStatus::HasData: return "has-data";
        case ColumnStatus::NoData: return "no-data";
        case ColumnStatus::NotInRegion: return "not-in-region";
    }
    return "unknown";
}

Result<const SvgTemplate*> SvgRenderer::loaded_template() const {
    std::lock_guard<std::mutex> lock(template_mutex_);
    if (!template_) {
        auto parsed = SvgTemplate::load(template_path_);
        if (!parsed) return parsed.error();
        template_ = std::move(parsed).value();
        EYEMAP_LOG_DEBUG("Loaded SVG template %s", template_path_.c_str());
    }
    return &*template_;
}

TemplateContext SvgRenderer::build_context(const HexagonGrid& grid, const LayoutConfig& layout,
                                           const LegendConfig& legend) const {
    const std::string outline = colors::HEX_OUTLINE.to_hex();

    TemplateContext root;
    root.set("width", std::to_string(layout.width));
    root.set("height", std::to_string(layout.height));
    root.set("background", colors::BACKGROUND.to_hex());
    root.set("text_color", colors::TEXT.to_hex());
    root.set("outline", outline);
    root.set("title", grid.plot_desc);
    root.set("subtitle", grid.region_desc + " · " + grid.neuron_desc);
    root.set("title_x", format_number(layout.title_x));
    root.set("title_y", format_number(layout.title_y));
    root.set("subtitle_y", format_number(layout.subtitle_y));
    root.set("region", grid.region);
    root.set("side", short_label(grid.side));
    root.set("metric", to_string(grid.metric));

    auto& hexagons = root.list("hexagons");
    hexagons.reserve(grid.hexagons.size());
    for (const auto& hexagon : grid.hexagons) {
        const double cx = hexagon.pixel_x + layout.offset_x;
        const double cy = hexagon.pixel_y + layout.offset_y;

        TemplateContext hex;
        hex.set("status", status_class(hexagon.status));
        hex.set("hex1", std::to_string(hexagon.hex1));
        hex.set("hex2", std::to_string(hexagon.hex2));
        hex.set("points", points_string(coordinates_.hexagon_points(cx, cy)));
        hex.set("fill", hexagon.color.to_hex());
        hex.set("tooltip", hexagon.tooltip);

        // Layers as concentric rings, layer 1 outermost
        auto& layers = hex.list("layers");
        const std::size_t n = hexagon.layer_colors.size();
        for (std::size_t i = 0; i < n; ++i) {
            const double radius = layout.hex_size * static_cast<double>(n - i) / static_cast<double>(n);
            TemplateContext layer;
            layer.set("layer", std::to_string(i + 1));
            layer.set("points", points_string(coordinates_.hexagon_points(cx, cy, radius)));
            layer.set("fill", hexagon.layer_colors[i].to_hex());
            layer.set("tooltip", i < hexagon.tooltip_layers.size() ? hexagon.tooltip_layers[i] : std::string());
            layers.push_back(std::move(layer));
        }
        hexagons.push_back(std::move(hex));
    }

    root.set("legend_title", legend.title);
    root.set("legend_title_x", format_number(layout.legend_title_x));
    root.set("legend_title_y", format_number(layout.legend_title_y));
    root.set("legend_x", format_number(layout.legend_x));
    root.set("legend_y", format_number(layout.legend_y));
    root.set("legend_width", format_number(layout.legend_width));
    root.set("legend_height", format_number(layout.legend_height));

    auto& swatches = root.list("swatches");
    for (const auto& swatch : legend.swatches) {
        TemplateContext s;
        s.set("x", format_number(layout.legend_x));
        s.set("y", format_number(swatch.y));
        s.set("width", format_number(layout.legend_width));
        s.set("height", format_number(swatch.height));
        s.set("fill", swatch.color.to_hex());
        swatches.push_back(std::move(s));
    }

    auto& ticks = root.list("ticks");
    const double x1 = layout.legend_x + layout.legend_width;
    for (const auto& tick : legend.ticks) {
        TemplateContext t;
        t.set("x1", format_number(x1));
        t.set("x2", format_number(x1 + TICK_LENGTH));
        t.set("y", format_number(tick.y));
        t.set("label_x", format_number(x1 + TICK_LENGTH + TICK_LABEL_GAP));
        t.set("label_y", format_number(tick.y + TICK_LABEL_BASELINE));
        t.set("label", tick.label);
        ticks.push_back(std::move(t));
    }

    return root;
}

Result<std::string> SvgRenderer::render(const HexagonGrid& grid, const LayoutConfig& layout,
                                        const LegendConfig& legend) const {
    auto tmpl = loaded_template();
    if (!tmpl) return tmpl.error();
    return tmpl.value()->render(build_context(grid, layout, legend));
}

} // namespace eyemap
