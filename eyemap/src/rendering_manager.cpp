#include <eyemap/log.hpp>
#include <eyemap/rendering_manager.hpp>

namespace eyemap {

RenderingManager::RenderingManager(const EyemapConfig& config, CoordinateSystem coordinates, ColorMapper colors,
                                   LayoutCalculator layout)
    : colors_(std::move(colors))
    , layout_(layout)
    , svg_(config.template_path(), coordinates)
    , png_(config.png_scale, coordinates)
    , writer_(config.eyemaps_dir()) {}

std::string RenderingManager::filename_for(const HexagonGrid& grid, OutputFormat format) {
    const char* extension = format == OutputFormat::Png ? ".png" : ".svg";
    return OutputWriter::sanitize_filename(grid.plot_desc + "_" + grid.region_desc + "_" + grid.neuron_desc) +
           extension;
}

Result<std::string> RenderingManager::render_content(const RenderingRequest& request) const {
    if (request.grid != nullptr && request.grid->hexagons.empty()) {
        return make_error(ErrorKind::Rendering, "cannot render an empty hexagon list", "render_grid");
    }
    if (auto status = validator_.validate_rendering_request(request); !status) {
        return status.error();
    }

    const HexagonGrid& grid = *request.grid;

    auto layout = layout_.calculate_layout(grid.hexagons);
    if (!layout) return layout.error();

    const LegendConfig legend = layout_.calculate_legend(layout.value(), grid.value_range, grid.metric, colors_);

    if (request.output_format == OutputFormat::Png) {
        return png_.render(grid, layout.value(), legend);
    }
    return svg_.render(grid, layout.value(), legend);
}

Result<Artifact> RenderingManager::finalize(const RenderingRequest& request, const std::string& content) const {
    if (request.save_to_file) {
        auto path = writer_.write(filename_for(*request.grid, request.output_format), content);
        if (!path) return path.error();
        return Artifact{ArtifactKind::File, std::move(path).value()};
    }
    if (request.output_format == OutputFormat::Png) {
        return Artifact{ArtifactKind::InlinePng, PngRenderer::to_data_uri(content)};
    }
    return Artifact{ArtifactKind::InlineSvg, content};
}

Result<Artifact> RenderingManager::render(const RenderingRequest& request) const {
    auto content = render_content(request);
    if (!content) return content.error();
    return finalize(request, content.value());
}

} // namespace eyemap
