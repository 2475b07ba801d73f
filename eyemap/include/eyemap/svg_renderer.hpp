#ifndef EYEMAP_SVG_RENDERER_HPP
#define EYEMAP_SVG_RENDERER_HPP

#include <eyemap/coordinate_system.hpp>
#include <eyemap/layout_calculator.hpp>
#include <eyemap/result.hpp>
#include <eyemap/svg_template.hpp>
#include <eyemap/types.hpp>
#include <array>
#include <mutex>
#include <optional>
#include <string>

namespace eyemap {

/**
 * Template-driven SVG emission. All geometry is computed here; the template
 * only iterates and interpolates. The parsed template is loaded on first use
 * and shared by every render call of this renderer.
 */
class SvgRenderer {
public:
    SvgRenderer(std::string template_path, CoordinateSystem coordinates);

    Result<std::string> render(const HexagonGrid& grid, const LayoutConfig& layout,
                               const LegendConfig& legend) const;

    TemplateContext build_context(const HexagonGrid& grid, const LayoutConfig& layout,
                                  const LegendConfig& legend) const;

    // Fixed two-decimal formatting keeps output byte-stable
    static std::string format_number(double value);
    static std::string points_string(const std::array<PixelPoint, 6>& points);
    static const char* status_class(ColumnStatus status);

    const std::string& template_path() const { return template_path_; }

private:
    Result<const SvgTemplate*> loaded_template() const;

    std::string template_path_;
    CoordinateSystem coordinates_;

    mutable std::mutex template_mutex_;
    mutable std::optional<SvgTemplate> template_;
};

} // namespace eyemap

#endif // EYEMAP_SVG_RENDERER_HPP
