#ifndef EYEMAP_DATA_PROCESSOR_HPP
#define EYEMAP_DATA_PROCESSOR_HPP

#include <eyemap/requests.hpp>
#include <eyemap/result.hpp>
#include <eyemap/types.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace eyemap {

struct StatusCounts {
    std::size_t has_data = 0;
    std::size_t no_data = 0;
    std::size_t not_in_region = 0;

    std::size_t total() const { return has_data + no_data + not_in_region; }
};

struct ProcessingResult {
    std::vector<ProcessedColumn> processed_columns;
    ValueRange value_range;
    StatusCounts counts;
};

/**
 * Observations that could not be placed in a data map. A fault with a
 * region fails only that (region, side) grid; one without a region
 * belongs to no grid.
 */
struct ObservationFault {
    std::string region;
    Hemisphere side = Hemisphere::Right;
    Error error;
};

struct OrganizedObservations {
    SideDataMaps maps;
    std::vector<ObservationFault> faults;

    // First fault recorded for (region, side), or nullptr
    const Error* fault_for(const std::string& region, Hemisphere side) const;
};

/**
 * Merges the lattice of possible columns with the observed columns of one
 * neuron type and classifies every rendered cell.
 *
 * Classification of a cell (hex1, hex2) for grid (region, side):
 *   1. not in the region/side lattice          -> NotInRegion
 *   2. in the lattice, no observation           -> NoData
 *   3. otherwise                                -> HasData (zero is a value)
 *
 * The rendered cell set is the de-duplicated union of the whole lattice in
 * first-appearance order, so repeated calls give identical ordering.
 */
class DataProcessor {
public:
    static constexpr double DEGENERATE_EPSILON = 0.1;

    // Split observations into one data map per hemisphere; fails on the first fault
    Result<SideDataMaps> organize_by_side(const std::vector<ColumnObservation>& observations) const;

    // Same split, but keeps going and records every fault
    OrganizedObservations organize_observations(const std::vector<ColumnObservation>& observations) const;

    Result<std::vector<ProcessedColumn>> classify(const std::vector<PossibleColumn>& possible_columns,
                                                  const DataMap& observed,
                                                  const std::string& region,
                                                  Hemisphere side,
                                                  MetricType metric) const;

    // nullptr or empty thresholds give the default range [0, 1]
    Result<ValueRange> determine_value_range(const Thresholds* thresholds) const;

    // Precondition check + classification + value range
    Result<ProcessingResult> process(const SingleRegionGridRequest& request) const;

    // Largest layer count among the region's observations
    static std::size_t layer_count(const DataMap& observed, const std::string& region);

    // Ordered, de-duplicated union of all lattice coordinates
    static std::vector<HexCoord> rendered_cells(const std::vector<PossibleColumn>& possible_columns);
};

} // namespace eyemap

#endif // EYEMAP_DATA_PROCESSOR_HPP
