#ifndef EYEMAP_TOOLTIP_GENERATOR_HPP
#define EYEMAP_TOOLTIP_GENERATOR_HPP

#include <eyemap/types.hpp>
#include <string>
#include <vector>

namespace eyemap {

struct TooltipText {
    std::string summary;
    std::vector<std::string> layers;   // Index-aligned with layer_values
};

class TooltipGenerator {
public:
    static const char* metric_label(MetricType metric);

    // Region-specific layer naming, e.g. LO layer 5 -> "LO5A"
    static std::string display_layer_name(const std::string& region, std::size_t layer_number);

    TooltipText tooltip_for(const HexagonDescriptor& hexagon, const std::string& region,
                            Hemisphere side, MetricType metric) const;

    // Finalize step: attach tooltip text to every hexagon of the grid
    void attach(HexagonGrid& grid) const;
};

} // namespace eyemap

#endif // EYEMAP_TOOLTIP_GENERATOR_HPP
