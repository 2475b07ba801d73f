#include <eyemap/log.hpp>
#include <eyemap/validation.hpp>
#include <filesystem>
#include <string>
#include <system_error>

namespace eyemap {

namespace {

constexpr const char* PNG_DATA_URI_PREFIX = "data:image/png;base64,";

std::string enum_value(int raw) {
    return std::to_string(raw);
}

} // namespace

bool RequestValidator::is_valid(SomaSide side) {
    switch (side) {
        case SomaSide::Left:
        case SomaSide::Right:
        case SomaSide::Combined:
            return true;
    }
    return false;
}

bool RequestValidator::is_valid(Hemisphere side) {
    return side == Hemisphere::Left || side == Hemisphere::Right;
}

bool RequestValidator::is_valid(MetricType metric) {
    return metric == MetricType::SynapseDensity || metric == MetricType::CellCount;
}

bool RequestValidator::is_valid(OutputFormat format) {
    return format == OutputFormat::Svg || format == OutputFormat::Png;
}

Status RequestValidator::validate_grid_generation_request(const GridGenerationRequest& request) const {
    const char* op = "validate_grid_generation_request";

    if (request.neuron_type.empty()) {
        return make_validation_error("neuron_type cannot be empty", "neuron_type", "", op);
    }
    if (!is_valid(request.soma_side)) {
        return make_validation_error("invalid soma side", "soma_side",
                                     enum_value(static_cast<int>(request.soma_side)), op);
    }
    if (!is_valid(request.output_format)) {
        return make_validation_error("invalid output format", "output_format",
                                     enum_value(static_cast<int>(request.output_format)), op);
    }
    if (request.all_possible_columns.empty()) {
        return make_validation_error("lattice of possible columns cannot be empty",
                                     "all_possible_columns", "0", op);
    }
    if (request.metrics.empty()) {
        return make_validation_error("at least one metric type is required", "metrics", "0", op);
    }
    for (MetricType metric : request.metrics) {
        if (!is_valid(metric)) {
            return make_validation_error("invalid metric type", "metrics",
                                         enum_value(static_cast<int>(metric)), op);
        }
    }
    return ok_status();
}

Status RequestValidator::validate_single_region_request(const SingleRegionGridRequest& request) const {
    const char* op = "validate_single_region_request";

    if (request.all_possible_columns == nullptr) {
        return make_validation_error("lattice of possible columns is required",
                                     "all_possible_columns", "null", op);
    }
    if (request.region_name.empty()) {
        return make_validation_error("region_name cannot be empty", "region_name", "", op);
    }
    if (!is_valid(request.side)) {
        return make_validation_error("invalid hemisphere", "side",
                                     enum_value(static_cast<int>(request.side)), op);
    }
    if (!is_valid(request.metric_type)) {
        return make_validation_error("invalid metric type", "metric_type",
                                     enum_value(static_cast<int>(request.metric_type)), op);
    }
    if (!is_valid(request.output_format)) {
        return make_validation_error("invalid output format", "output_format",
                                     enum_value(static_cast<int>(request.output_format)), op);
    }
    return ok_status();
}

Status RequestValidator::validate_rendering_request(const RenderingRequest& request) const {
    const char* op = "validate_rendering_request";

    if (request.grid == nullptr) {
        return make_validation_error("grid is required", "grid", "null", op);
    }
    const HexagonGrid& grid = *request.grid;
    if (grid.hexagons.empty()) {
        return make_validation_error("hexagons list cannot be empty", "hexagons", "0", op);
    }
    if (grid.region.empty()) {
        return make_validation_error("region cannot be empty", "region", "", op);
    }
    if (!is_valid(grid.metric)) {
        return make_validation_error("invalid metric type", "metric_type",
                                     enum_value(static_cast<int>(grid.metric)), op);
    }
    if (!is_valid(request.output_format)) {
        return make_validation_error("invalid output format", "output_format",
                                     enum_value(static_cast<int>(request.output_format)), op);
    }
    if (!(grid.value_range.min_value < grid.value_range.max_value)) {
        return make_validation_error("min_value must be less than max_value", "value_range",
                                     std::to_string(grid.value_range.min_value) + ".." +
                                         std::to_string(grid.value_range.max_value), op);
    }
    return ok_status();
}

Status RuntimeValidator::validate_operation_preconditions(const std::string& operation,
                                                          std::initializer_list<Check> checks) const {
    for (const auto& [name, satisfied] : checks) {
        if (!satisfied) {
            EYEMAP_LOG_DEBUG("Precondition %s failed for %s", name, operation.c_str());
            return make_validation_error("precondition not met", name, "false", operation);
        }
    }
    return ok_status();
}

Status RuntimeValidator::validate_data_map_present(const DataMap* data_map, const std::string& operation) const {
    if (data_map == nullptr) {
        return make_validation_error("data map keyed by region and coordinates is required",
                                     "data_map", "null", operation);
    }
    return ok_status();
}

Status RuntimeValidator::validate_result_integrity(const Artifact& artifact, const std::string& operation) const {
    switch (artifact.kind) {
        case ArtifactKind::InlineSvg:
            if (artifact.content.find("<svg") == std::string::npos) {
                return make_error(ErrorKind::Rendering, "rendered SVG content is empty or malformed", operation);
            }
            break;
        case ArtifactKind::InlinePng:
            if (artifact.content.rfind(PNG_DATA_URI_PREFIX, 0) != 0) {
                return make_error(ErrorKind::Rendering, "inline PNG is not a data URI", operation);
            }
            break;
        case ArtifactKind::File: {
            std::error_code ec;
            if (artifact.content.empty() || !std::filesystem::exists(artifact.content, ec)) {
                return make_error(ErrorKind::Rendering, "saved artifact not found: " + artifact.content, operation);
            }
            break;
        }
    }
    return ok_status();
}

} // namespace eyemap
