#ifndef EYEMAP_TYPES_HPP
#define EYEMAP_TYPES_HPP

#include <eyemap/result.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace eyemap {

// Hemisphere of a single rendered grid
enum class Hemisphere {
    Left,
    Right
};

// Side selector of a request; Combined renders both hemispheres independently
enum class SomaSide {
    Left,
    Right,
    Combined
};

enum class MetricType {
    SynapseDensity,
    CellCount
};

enum class OutputFormat {
    Svg,
    Png
};

enum class ColumnStatus {
    HasData,      // An observation exists for this cell
    NoData,       // Cell belongs to the region/side but nothing was observed
    NotInRegion   // Cell is outside the region/side lattice being rendered
};

const char* to_string(Hemisphere side);
const char* to_string(SomaSide side);
const char* to_string(MetricType metric);
const char* to_string(OutputFormat format);
const char* to_string(ColumnStatus status);

// "L" / "R"
const char* short_label(Hemisphere side);

std::vector<Hemisphere> sides_for(SomaSide side);

// Boundary parsing; internal code only consumes the enums
Result<SomaSide> parse_soma_side(const std::string& text);
Result<MetricType> parse_metric_type(const std::string& text);
Result<OutputFormat> parse_output_format(const std::string& text);

const std::vector<MetricType>& all_metric_types();

/**
 * Per-layer sub-counts of one column observation.
 */
struct LayerCounts {
    double synapse_count = 0.0;
    double neuron_count = 0.0;
};

/**
 * One column observed for a neuron type. Produced upstream, immutable here.
 */
struct ColumnObservation {
    std::string region;
    int hex1 = 0;
    int hex2 = 0;
    Hemisphere side = Hemisphere::Right;
    double synapse_count = 0.0;
    double neuron_count = 0.0;
    std::vector<LayerCounts> layers;

    double metric_value(MetricType metric) const {
        return metric == MetricType::SynapseDensity ? synapse_count : neuron_count;
    }
};

/**
 * One legal lattice cell of a region/hemisphere, independent of neuron type.
 */
struct PossibleColumn {
    std::string region;
    Hemisphere side = Hemisphere::Right;
    int hex1 = 0;
    int hex2 = 0;
};

using HexCoord = std::pair<int, int>;

/**
 * Lookup key for observations within one hemisphere.
 */
struct ColumnKey {
    std::string region;
    int hex1 = 0;
    int hex2 = 0;

    bool operator<(const ColumnKey& other) const {
        return std::tie(region, hex1, hex2) < std::tie(other.region, other.hex1, other.hex2);
    }
    bool operator==(const ColumnKey& other) const {
        return region == other.region && hex1 == other.hex1 && hex2 == other.hex2;
    }
};

using DataMap = std::map<ColumnKey, ColumnObservation>;

// One data map per hemisphere
struct SideDataMaps {
    DataMap left;
    DataMap right;

    const DataMap& for_side(Hemisphere side) const {
        return side == Hemisphere::Left ? left : right;
    }
};

struct ProcessedColumn {
    int hex1 = 0;
    int hex2 = 0;
    ColumnStatus status = ColumnStatus::NoData;
    std::optional<double> value;        // Set only when status == HasData
    std::vector<double> layer_values;   // Index-aligned with the region's layers
};

/**
 * Active color scale range. Always min_value < max_value.
 */
struct ValueRange {
    double min_value = 0.0;
    double max_value = 1.0;
};

/**
 * Ascending threshold breakpoints. front() is the minimum, back() the maximum.
 */
struct Thresholds {
    std::vector<double> values;
};

class ThresholdTable {
public:
    void set(MetricType metric, const std::string& region, Thresholds thresholds) {
        entries_[{metric, region}] = std::move(thresholds);
    }

    const Thresholds* find(MetricType metric, const std::string& region) const {
        auto it = entries_.find({metric, region});
        return it != entries_.end() ? &it->second : nullptr;
    }

    bool empty() const { return entries_.empty(); }

private:
    std::map<std::pair<MetricType, std::string>, Thresholds> entries_;
};

/**
 * Optional global normalization for per-layer colors, keyed by region.
 */
struct MinMaxData {
    std::map<std::string, ValueRange> synapses_by_region;
    std::map<std::string, ValueRange> cells_by_region;

    const ValueRange* find(MetricType metric, const std::string& region) const {
        const auto& table = metric == MetricType::SynapseDensity ? synapses_by_region : cells_by_region;
        auto it = table.find(region);
        return it != table.end() ? &it->second : nullptr;
    }
};

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;

    bool operator==(const Color& other) const { return r == other.r && g == other.g && b == other.b; }
    bool operator!=(const Color& other) const { return !(*this == other); }

    // Lowercase "#rrggbb"
    std::string to_hex() const;
};

/**
 * Render-ready hexagon. Only the tooltip fields are filled after creation.
 */
struct HexagonDescriptor {
    int hex1 = 0;
    int hex2 = 0;
    double pixel_x = 0.0;
    double pixel_y = 0.0;
    std::optional<double> value;
    std::vector<double> layer_values;
    Color color;
    std::vector<Color> layer_colors;
    ColumnStatus status = ColumnStatus::NoData;
    std::string region;
    Hemisphere side = Hemisphere::Right;
    std::string tooltip;
    std::vector<std::string> tooltip_layers;
};

/**
 * Hexagons of one region/side/metric plus the metadata needed to render them.
 */
struct HexagonGrid {
    std::string region;
    Hemisphere side = Hemisphere::Right;
    MetricType metric = MetricType::SynapseDensity;
    ValueRange value_range;
    std::string plot_desc;
    std::string region_desc;
    std::string neuron_desc;
    std::vector<HexagonDescriptor> hexagons;
};

enum class ArtifactKind {
    InlineSvg,   // SVG markup
    InlinePng,   // data:image/png;base64 URI
    File         // Path of the written file
};

struct Artifact {
    ArtifactKind kind = ArtifactKind::InlineSvg;
    std::string content;
};

} // namespace eyemap

#endif // EYEMAP_TYPES_HPP
