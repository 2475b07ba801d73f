#include <eyemap/tooltip_generator.hpp>
#include <cmath>
#include <cstdio>
#include <map>
#include <string>
#include <utility>

namespace eyemap {

namespace {

// Layers whose external name differs from their index, per region
const std::map<std::pair<std::string, std::size_t>, std::string>& layer_remap() {
    static const std::map<std::pair<std::string, std::size_t>, std::string> table = {
        {{"LO", 5}, "5A"},
        {{"LO", 6}, "5B"},
        {{"LO", 7}, "6"},
    };
    return table;
}

// Whole part toward zero; counts are never shown with decimals
std::string truncated(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0.0 ? "inf" : "-inf";
    char buffer[400];
    std::snprintf(buffer, sizeof(buffer), "%.0f", std::trunc(value) + 0.0);
    return buffer;
}

std::string column_line(const HexagonDescriptor& hexagon) {
    return "Column: " + std::to_string(hexagon.hex1) + ", " + std::to_string(hexagon.hex2);
}

} // namespace

const char* TooltipGenerator::metric_label(MetricType metric) {
    return metric == MetricType::SynapseDensity ? "Synapse count" : "Cell count";
}

std::string TooltipGenerator::display_layer_name(const std::string& region, std::size_t layer_number) {
    auto it = layer_remap().find({region, layer_number});
    if (it != layer_remap().end()) {
        return region + it->second;
    }
    return region + std::to_string(layer_number);
}

TooltipText TooltipGenerator::tooltip_for(const HexagonDescriptor& hexagon, const std::string& region,
                                          Hemisphere side, MetricType metric) const {
    const std::string roi = region + " (" + short_label(side) + ")";
    const std::string label = metric_label(metric);
    const std::string column = column_line(hexagon);

    TooltipText text;
    switch (hexagon.status) {
        case ColumnStatus::NotInRegion:
            text.summary = column + "\nColumn not identified in " + roi;
            break;
        case ColumnStatus::NoData:
            text.summary = column + "\n" + label + ": 0\nROI: " + roi;
            break;
        case ColumnStatus::HasData:
            text.summary = column + "\n" + label + ": " + truncated(hexagon.value.value_or(0.0)) + "\nROI: " + roi;
            break;
    }

    text.layers.reserve(hexagon.layer_values.size());
    for (std::size_t i = 0; i < hexagon.layer_values.size(); ++i) {
        const std::size_t layer = i + 1;
        switch (hexagon.status) {
            case ColumnStatus::NotInRegion:
                text.layers.push_back(column + "\nColumn not identified in " + roi +
                                      " layer(" + std::to_string(layer) + ")");
                break;
            case ColumnStatus::NoData:
                text.layers.push_back("0\nROI: " + display_layer_name(region, layer));
                break;
            case ColumnStatus::HasData:
                text.layers.push_back(truncated(hexagon.layer_values[i]) + "\nROI: " +
                                      display_layer_name(region, layer));
                break;
        }
    }
    return text;
}

void TooltipGenerator::attach(HexagonGrid& grid) const {
    for (auto& hexagon : grid.hexagons) {
        TooltipText text = tooltip_for(hexagon, grid.region, grid.side, grid.metric);
        hexagon.tooltip = std::move(text.summary);
        hexagon.tooltip_layers = std::move(text.layers);
    }
}

} // namespace eyemap
