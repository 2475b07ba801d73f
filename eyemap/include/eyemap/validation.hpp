#ifndef EYEMAP_VALIDATION_HPP
#define EYEMAP_VALIDATION_HPP

#include <eyemap/requests.hpp>
#include <eyemap/result.hpp>
#include <eyemap/types.hpp>
#include <initializer_list>
#include <string>
#include <utility>

namespace eyemap {

/**
 * Structural checks on request objects, run once before any processing.
 * Each failure is a single ValidationError naming the offending field.
 */
class RequestValidator {
public:
    Status validate_grid_generation_request(const GridGenerationRequest& request) const;
    Status validate_single_region_request(const SingleRegionGridRequest& request) const;
    Status validate_rendering_request(const RenderingRequest& request) const;

    static bool is_valid(SomaSide side);
    static bool is_valid(Hemisphere side);
    static bool is_valid(MetricType metric);
    static bool is_valid(OutputFormat format);
};

/**
 * Runtime preconditions: dependent data must exist before the stage that
 * consumes it runs.
 */
class RuntimeValidator {
public:
    using Check = std::pair<const char*, bool>;

    // Fails on the first check whose flag is false
    Status validate_operation_preconditions(const std::string& operation,
                                            std::initializer_list<Check> checks) const;

    Status validate_data_map_present(const DataMap* data_map, const std::string& operation) const;

    // Rendered output must look like what its kind promises
    Status validate_result_integrity(const Artifact& artifact, const std::string& operation) const;
};

} // namespace eyemap

#endif // EYEMAP_VALIDATION_HPP
