#ifndef EYEMAP_EYEMAP_GENERATOR_HPP
#define EYEMAP_EYEMAP_GENERATOR_HPP

#include <eyemap/color_mapper.hpp>
#include <eyemap/config.hpp>
#include <eyemap/coordinate_system.hpp>
#include <eyemap/data_processor.hpp>
#include <eyemap/grid_cache.hpp>
#include <eyemap/layout_calculator.hpp>
#include <eyemap/rendering_manager.hpp>
#include <eyemap/requests.hpp>
#include <eyemap/result.hpp>
#include <eyemap/tooltip_generator.hpp>
#include <eyemap/types.hpp>
#include <eyemap/validation.hpp>
#include <job_system/job_system.hpp>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>

namespace eyemap {

/**
 * The full service graph, built once from a validated configuration and
 * never modified afterwards. Shared read-only by every worker.
 */
struct EyemapServices {
    explicit EyemapServices(const EyemapConfig& config);

    EyemapServices(const EyemapServices&) = delete;
    EyemapServices& operator=(const EyemapServices&) = delete;

    CoordinateSystem coordinates;
    ColorMapper colors;
    DataProcessor processor;
    TooltipGenerator tooltips;
    LayoutCalculator layout;
    RenderingManager rendering;
};

std::unique_ptr<EyemapServices> make_services(const EyemapConfig& config);

/**
 * Orchestrates processing and rendering over the (region, side, metric)
 * cross-product of a request.
 *
 * Single-region calls return their error to the caller. The batch call
 * contains failures per (region, side) pair: a failing pair becomes a
 * warning and is left out of the result map.
 */
class EyemapGenerator {
public:
    // Validates the config, builds the services and, if enabled, a sharded cache
    static Result<std::unique_ptr<EyemapGenerator>> create(const EyemapConfig& config);

    // `config` must already be valid; a null cache disables caching
    EyemapGenerator(EyemapConfig config, std::unique_ptr<EyemapServices> services,
                    std::shared_ptr<GridCache> cache = nullptr);
    ~EyemapGenerator();

    EyemapGenerator(const EyemapGenerator&) = delete;
    EyemapGenerator& operator=(const EyemapGenerator&) = delete;

    GridGenerationResult generate(const GridGenerationRequest& request);

    Result<Artifact> generate_single_region_grid(const SingleRegionGridRequest& request) const;

    // Hexagon descriptors of one grid, tooltips attached, nothing rendered
    Result<HexagonGrid> build_grid(const SingleRegionGridRequest& request) const;

    // Number of evicted entries; 0 when caching is disabled
    std::size_t clear_cache();
    std::optional<CacheStatistics> cache_statistics() const;

    const EyemapConfig& config() const { return config_; }
    const EyemapServices& services() const { return *services_; }
    bool caching_enabled() const { return cache_ != nullptr; }

    static std::string plot_description(MetricType metric);

private:
    enum class JobKind {
        RegionSide
    };

    struct PairOutcome {
        MetricArtifacts artifacts;
        std::vector<std::string> warnings;
        bool completed = false;
    };

    void run_pair(const GridGenerationRequest& request, const SideDataMaps& maps,
                  const RegionSideKey& key, PairOutcome& outcome) const;

    Result<std::vector<Color>> layer_colors(const ProcessedColumn& column, const SingleRegionGridRequest& request) const;

    Result<std::string> cached_content(const SingleRegionGridRequest& request, const RenderingRequest& rendering) const;

    EyemapConfig config_;
    std::unique_ptr<EyemapServices> services_;
    std::shared_ptr<GridCache> cache_;
    RequestValidator validator_;
    RuntimeValidator runtime_;

    // Null when pairs run inline on the calling thread
    std::unique_ptr<job_system::JobSystem<JobKind>> pool_;
    std::mutex batch_mutex_;
};

} // namespace eyemap

#endif // EYEMAP_EYEMAP_GENERATOR_HPP
