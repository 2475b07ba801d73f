#ifndef EYEMAP_REQUESTS_HPP
#define EYEMAP_REQUESTS_HPP

#include <eyemap/types.hpp>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace eyemap {

/**
 * Top-level request: everything needed to render all regions and sides of
 * one neuron type. Validated once at ingress, immutable afterwards.
 */
struct GridGenerationRequest {
    std::vector<ColumnObservation> column_data;
    std::vector<PossibleColumn> all_possible_columns;
    ThresholdTable thresholds;
    std::string neuron_type;
    SomaSide soma_side = SomaSide::Combined;
    OutputFormat output_format = OutputFormat::Svg;
    bool save_to_files = false;
    std::optional<MinMaxData> min_max_data;
    std::vector<MetricType> metrics = all_metric_types();

    // Regions of the lattice in first-appearance order
    std::vector<std::string> regions() const;
};

/**
 * Request for one region/side/metric grid. Pointer members are non-owning
 * views into data that must outlive the call.
 */
struct SingleRegionGridRequest {
    const std::vector<PossibleColumn>* all_possible_columns = nullptr;
    const DataMap* data_map = nullptr;
    std::string region_name;
    Hemisphere side = Hemisphere::Right;
    MetricType metric_type = MetricType::SynapseDensity;
    std::string neuron_type;
    const Thresholds* thresholds = nullptr;       // nullptr = default [0, 1]
    const MinMaxData* min_max_data = nullptr;     // nullptr = white layer colors
    OutputFormat output_format = OutputFormat::Svg;
    bool save_to_file = false;
};

struct RenderingRequest {
    const HexagonGrid* grid = nullptr;
    OutputFormat output_format = OutputFormat::Svg;
    bool save_to_file = false;
};

struct RegionSideKey {
    std::string region;
    Hemisphere side = Hemisphere::Right;

    bool operator<(const RegionSideKey& other) const {
        return std::tie(region, side) < std::tie(other.region, other.side);
    }
    bool operator==(const RegionSideKey& other) const {
        return region == other.region && side == other.side;
    }

    // "ME_R"
    std::string to_string() const;
};

using MetricArtifacts = std::map<MetricType, Artifact>;

struct GridGenerationResult {
    std::map<RegionSideKey, MetricArtifacts> region_grids;
    double processing_time = 0.0;   // Seconds
    bool success = false;
    std::optional<std::string> error_message;
    std::vector<std::string> warnings;
};

} // namespace eyemap

#endif // EYEMAP_REQUESTS_HPP
