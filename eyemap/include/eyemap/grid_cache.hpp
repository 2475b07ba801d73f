#ifndef EYEMAP_GRID_CACHE_HPP
#define EYEMAP_GRID_CACHE_HPP

#include <eyemap/result.hpp>
#include <eyemap/types.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace eyemap {

/**
 * Identity of one rendered grid. The fingerprint covers the observations and
 * lattice the grid was built from, so a hit always equals recomputation.
 */
struct GridCacheKey {
    std::string region;
    Hemisphere side = Hemisphere::Right;
    MetricType metric = MetricType::SynapseDensity;
    std::string neuron_type;
    std::string threshold_signature;
    OutputFormat format = OutputFormat::Svg;
    std::uint64_t fingerprint = 0;

    std::string to_string() const;
};

struct CacheStatistics {
    std::size_t hits = 0;
    std::size_t misses = 0;
    std::size_t entries = 0;
    std::size_t evictions = 0;
};

/**
 * Best-effort memoization of rendered content. Never authoritative: any
 * implementation may drop entries at any time.
 */
class GridCache {
public:
    virtual ~GridCache() = default;

    virtual std::optional<std::string> get(const GridCacheKey& key) = 0;

    // Last write wins; failures are PerformanceErrors
    virtual Status put(const GridCacheKey& key, std::string value) = 0;

    // Returns the number of evicted entries
    virtual std::size_t clear() = 0;

    virtual CacheStatistics statistics() const = 0;
};

/**
 * Fixed number of shards, each behind its own reader/writer lock. Readers of
 * a shard proceed together; writers to different shards never contend.
 *
 * Each shard holds at most ceil(max_entries / shard_count) entries and drops
 * its oldest insertion first once full. Overwriting a key keeps its place.
 */
class ShardedGridCache : public GridCache {
public:
    static constexpr std::size_t DEFAULT_SHARD_COUNT = 16;
    static constexpr std::size_t DEFAULT_MAX_ENTRIES = 1000;

    explicit ShardedGridCache(std::size_t shard_count = DEFAULT_SHARD_COUNT,
                              std::size_t max_entries = DEFAULT_MAX_ENTRIES);

    std::optional<std::string> get(const GridCacheKey& key) override;
    Status put(const GridCacheKey& key, std::string value) override;
    std::size_t clear() override;
    CacheStatistics statistics() const override;

    std::size_t shard_count() const { return shards_.size(); }
    std::size_t shard_capacity() const { return shard_capacity_; }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, std::string> entries;
        std::deque<std::string> insertion_order;
    };

    Shard& shard_for(const std::string& key);

    std::vector<std::unique_ptr<Shard>> shards_;
    std::size_t shard_capacity_;
    std::atomic<std::size_t> hits_{0};
    std::atomic<std::size_t> misses_{0};
    std::atomic<std::size_t> evictions_{0};
};

// FNV-1a over the region's lattice cells and its observations on one side
std::uint64_t grid_fingerprint(const std::vector<PossibleColumn>& lattice, const DataMap& observed,
                               const std::string& region, const MinMaxData* min_max_data, MetricType metric);

// Stable text form of a threshold list; "default" when absent
std::string threshold_signature(const Thresholds* thresholds);

} // namespace eyemap

#endif // EYEMAP_GRID_CACHE_HPP
