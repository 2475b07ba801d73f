#include <eyemap/data_processor.hpp>
#include <eyemap/log.hpp>
#include <eyemap/validation.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <string>

namespace eyemap {

namespace {

std::string coord_string(const std::string& region, int hex1, int hex2) {
    return region + "(" + std::to_string(hex1) + "," + std::to_string(hex2) + ")";
}

std::vector<double> extract_layer_values(const ColumnObservation& obs, MetricType metric, std::size_t count) {
    std::vector<double> values(count, 0.0);
    const std::size_t n = std::min(count, obs.layers.size());
    for (std::size_t i = 0; i < n; ++i) {
        values[i] = metric == MetricType::SynapseDensity ? obs.layers[i].synapse_count
                                                         : obs.layers[i].neuron_count;
    }
    return values;
}

} // namespace

const Error* OrganizedObservations::fault_for(const std::string& region, Hemisphere side) const {
    for (const auto& fault : faults) {
        if (fault.region == region && fault.side == side) return &fault.error;
    }
    return nullptr;
}

OrganizedObservations DataProcessor::organize_observations(const std::vector<ColumnObservation>& observations) const {
    const char* op = "organize_data_by_side";
    OrganizedObservations out;

    for (std::size_t i = 0; i < observations.size(); ++i) {
        const ColumnObservation& obs = observations[i];
        if (obs.region.empty()) {
            Error e = make_error(ErrorKind::DataProcessing, "column observation is missing its region", op);
            e.field = "region";
            e.value = "index " + std::to_string(i);
            out.faults.push_back(ObservationFault{std::string(), obs.side, std::move(e)});
            continue;
        }

        DataMap& target = obs.side == Hemisphere::Left ? out.maps.left : out.maps.right;
        if (!target.emplace(ColumnKey{obs.region, obs.hex1, obs.hex2}, obs).second) {
            Error e = make_error(ErrorKind::DataProcessing, "duplicate column observation", op);
            e.field = "column";
            e.value = coord_string(obs.region, obs.hex1, obs.hex2) + " " + short_label(obs.side);
            out.faults.push_back(ObservationFault{obs.region, obs.side, std::move(e)});
        }
    }

    EYEMAP_LOG_DEBUG("Organized %zu observations (%zu left, %zu right, %zu faults)",
                     observations.size(), out.maps.left.size(), out.maps.right.size(), out.faults.size());
    return out;
}

Result<SideDataMaps> DataProcessor::organize_by_side(const std::vector<ColumnObservation>& observations) const {
    OrganizedObservations organized = organize_observations(observations);
    if (!organized.faults.empty()) {
        return organized.faults.front().error;
    }
    return std::move(organized.maps);
}

std::size_t DataProcessor::layer_count(const DataMap& observed, const std::string& region) {
    std::size_t count = 0;
    for (auto it = observed.lower_bound(ColumnKey{region, std::numeric_limits<int>::min(), std::numeric_limits<int>::min()});
         it != observed.end() && it->first.region == region; ++it) {
        count = std::max(count, it->second.layers.size());
    }
    return count;
}

std::vector<HexCoord> DataProcessor::rendered_cells(const std::vector<PossibleColumn>& possible_columns) {
    std::vector<HexCoord> cells;
    std::set<HexCoord> seen;
    cells.reserve(possible_columns.size());
    for (const auto& column : possible_columns) {
        HexCoord coord{column.hex1, column.hex2};
        if (seen.insert(coord).second) {
            cells.push_back(coord);
        }
    }
    return cells;
}

Result<std::vector<ProcessedColumn>> DataProcessor::classify(const std::vector<PossibleColumn>& possible_columns,
                                                             const DataMap& observed,
                                                             const std::string& region,
                                                             Hemisphere side,
                                                             MetricType metric) const {
    const char* op = "classify_columns";

    if (possible_columns.empty()) {
        return make_error(ErrorKind::DataProcessing, "possible-column lattice is empty", op);
    }

    std::set<HexCoord> region_cells;
    for (std::size_t i = 0; i < possible_columns.size(); ++i) {
        const PossibleColumn& column = possible_columns[i];
        if (column.region.empty()) {
            Error e = make_error(ErrorKind::DataProcessing, "lattice column is missing its region", op);
            e.field = "region";
            e.value = "index " + std::to_string(i);
            return e;
        }
        if (column.region == region && column.side == side) {
            region_cells.insert({column.hex1, column.hex2});
        }
    }

    if (region_cells.empty()) {
        Error e = make_error(ErrorKind::DataProcessing, "region has no lattice columns on this side", op);
        e.field = "region";
        e.value = region + " (" + short_label(side) + ")";
        return e;
    }

    const std::size_t n_layers = layer_count(observed, region);
    const std::vector<HexCoord> cells = rendered_cells(possible_columns);

    std::vector<ProcessedColumn> processed;
    processed.reserve(cells.size());

    for (const auto& [hex1, hex2] : cells) {
        ProcessedColumn column;
        column.hex1 = hex1;
        column.hex2 = hex2;

        if (region_cells.count({hex1, hex2}) == 0) {
            column.status = ColumnStatus::NotInRegion;
            column.layer_values.assign(n_layers, 0.0);
        } else {
            auto it = observed.find(ColumnKey{region, hex1, hex2});
            if (it == observed.end()) {
                column.status = ColumnStatus::NoData;
                column.layer_values.assign(n_layers, 0.0);
            } else {
                column.status = ColumnStatus::HasData;
                column.value = it->second.metric_value(metric);
                column.layer_values = extract_layer_values(it->second, metric, n_layers);
            }
        }
        processed.push_back(std::move(column));
    }

    EYEMAP_LOG_DEBUG("Classified %zu cells for %s (%s)", processed.size(), region.c_str(), short_label(side));
    return processed;
}

Result<ValueRange> DataProcessor::determine_value_range(const Thresholds* thresholds) const {
    const char* op = "value_range_determination";

    if (thresholds == nullptr || thresholds->values.empty()) {
        return ValueRange{0.0, 1.0};
    }

    for (double v : thresholds->values) {
        if (!std::isfinite(v)) {
            Error e = make_error(ErrorKind::DataProcessing, "all threshold values must be finite numbers", op);
            e.field = "thresholds";
            e.value = std::to_string(v);
            return e;
        }
    }

    ValueRange range{thresholds->values.front(), thresholds->values.back()};
    if (range.min_value > range.max_value) {
        Error e = make_error(ErrorKind::DataProcessing, "threshold minimum must not exceed maximum", op);
        e.field = "thresholds";
        e.value = std::to_string(range.min_value) + " > " + std::to_string(range.max_value);
        return e;
    }
    if (range.min_value == range.max_value) {
        // Degenerate: widen symmetrically so the scale stays defined
        range.min_value -= DEGENERATE_EPSILON;
        range.max_value += DEGENERATE_EPSILON;
        EYEMAP_LOG_DEBUG("Adjusted degenerate range to %f..%f", range.min_value, range.max_value);
    }
    return range;
}

Result<ProcessingResult> DataProcessor::process(const SingleRegionGridRequest& request) const {
    RuntimeValidator runtime;
    const char* op = "single_region_data_processing";

    if (auto status = runtime.validate_operation_preconditions(
            op, {{"all_possible_columns", request.all_possible_columns != nullptr},
                 {"region_name", !request.region_name.empty()}});
        !status) {
        return status.error();
    }
    if (auto status = runtime.validate_data_map_present(request.data_map, op); !status) {
        return status.error();
    }

    auto range = determine_value_range(request.thresholds);
    if (!range) return range.error();

    auto columns = classify(*request.all_possible_columns, *request.data_map,
                            request.region_name, request.side, request.metric_type);
    if (!columns) return columns.error();

    ProcessingResult result;
    result.value_range = range.value();
    result.processed_columns = std::move(columns).value();
    for (const auto& column : result.processed_columns) {
        switch (column.status) {
            case ColumnStatus::HasData: ++result.counts.has_data; break;
            case ColumnStatus::NoData: ++result.counts.no_data; break;
            case ColumnStatus::NotInRegion: ++result.counts.not_in_region; break;
        }
    }
    return result;
}

} // namespace eyemap
