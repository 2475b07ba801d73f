#ifndef EYEMAP_RENDERING_MANAGER_HPP
#define EYEMAP_RENDERING_MANAGER_HPP

#include <eyemap/color_mapper.hpp>
#include <eyemap/config.hpp>
#include <eyemap/coordinate_system.hpp>
#include <eyemap/layout_calculator.hpp>
#include <eyemap/output_writer.hpp>
#include <eyemap/png_renderer.hpp>
#include <eyemap/requests.hpp>
#include <eyemap/result.hpp>
#include <eyemap/svg_renderer.hpp>
#include <eyemap/validation.hpp>
#include <string>

namespace eyemap {

/**
 * Rendering pipeline for one grid:
 *   layout -> legend -> SVG text or PNG bytes -> embed or save
 *
 * render_content() is pure in its inputs, which is what the grid cache
 * stores; finalize() performs exactly one of embed or save.
 */
class RenderingManager {
public:
    RenderingManager(const EyemapConfig& config, CoordinateSystem coordinates, ColorMapper colors,
                     LayoutCalculator layout);

    // SVG markup, or encoded PNG bytes
    Result<std::string> render_content(const RenderingRequest& request) const;

    Result<Artifact> finalize(const RenderingRequest& request, const std::string& content) const;

    Result<Artifact> render(const RenderingRequest& request) const;

    // sanitize(plot_desc + "_" + region_desc + "_" + neuron_desc) + extension
    static std::string filename_for(const HexagonGrid& grid, OutputFormat format);

    const LayoutCalculator& layout() const { return layout_; }
    const SvgRenderer& svg() const { return svg_; }
    const PngRenderer& png() const { return png_; }
    const OutputWriter& writer() const { return writer_; }

private:
    RequestValidator validator_;
    ColorMapper colors_;
    LayoutCalculator layout_;
    SvgRenderer svg_;
    PngRenderer png_;
    OutputWriter writer_;
};

} // namespace eyemap

#endif // EYEMAP_RENDERING_MANAGER_HPP
