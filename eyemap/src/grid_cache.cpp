#include <eyemap/grid_cache.hpp>
#include <eyemap/log.hpp>
#include <cstdio>
#include <cstring>
#include <functional>
#include <mutex>
#include <new>

namespace eyemap {

namespace {

constexpr std::uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

std::uint64_t fnv_hash(std::uint64_t h, std::uint64_t value) {
    h ^= value;
    h *= FNV_PRIME;
    return h;
}

std::uint64_t fnv_hash(std::uint64_t h, double value) {
    std::uint64_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    return fnv_hash(h, bits);
}

std::uint64_t fnv_hash(std::uint64_t h, const std::string& text) {
    for (unsigned char c : text) {
        h = fnv_hash(h, static_cast<std::uint64_t>(c));
    }
    return fnv_hash(h, static_cast<std::uint64_t>(text.size()));
}

std::string format_double(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.17g", value);
    return buffer;
}

} // namespace

std::string GridCacheKey::to_string() const {
    char fp[24];
    std::snprintf(fp, sizeof(fp), "%016llx", static_cast<unsigned long long>(fingerprint));
    return region + "|" + short_label(side) + "|" + eyemap::to_string(metric) + "|" + neuron_type + "|" +
           threshold_signature + "|" + eyemap::to_string(format) + "|" + fp;
}

ShardedGridCache::ShardedGridCache(std::size_t shard_count, std::size_t max_entries) {
    if (shard_count == 0) shard_count = 1;
    if (max_entries == 0) max_entries = 1;
    shard_capacity_ = (max_entries + shard_count - 1) / shard_count;
    shards_.reserve(shard_count);
    for (std::size_t i = 0; i < shard_count; ++i) {
        shards_.emplace_back(std::make_unique<Shard>());
    }
}

ShardedGridCache::Shard& ShardedGridCache::shard_for(const std::string& key) {
    return *shards_[std::hash<std::string>{}(key) % shards_.size()];
}

std::optional<std::string> ShardedGridCache::get(const GridCacheKey& key) {
    const std::string k = key.to_string();
    Shard& shard = shard_for(k);

    std::shared_lock<std::shared_mutex> lock(shard.mutex);
    auto it = shard.entries.find(k);
    if (it == shard.entries.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second;
}

Status ShardedGridCache::put(const GridCacheKey& key, std::string value) {
    try {
        const std::string k = key.to_string();
        Shard& shard = shard_for(k);

        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        auto [it, inserted] = shard.entries.try_emplace(k);
        it->second = std::move(value);
        if (inserted) {
            try {
                shard.insertion_order.push_back(k);
            } catch (const std::bad_alloc&) {
                shard.entries.erase(it);
                throw;
            }
        }
        while (shard.entries.size() > shard_capacity_) {
            shard.entries.erase(shard.insertion_order.front());
            shard.insertion_order.pop_front();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }
    } catch (const std::bad_alloc&) {
        Error e = make_error(ErrorKind::Performance, "out of memory while caching grid", "cache_put");
        e.field = "region";
        e.value = key.region;
        return e;
    }
    return ok_status();
}

std::size_t ShardedGridCache::clear() {
    std::size_t evicted = 0;
    for (auto& shard : shards_) {
        std::unique_lock<std::shared_mutex> lock(shard->mutex);
        evicted += shard->entries.size();
        shard->entries.clear();
        shard->insertion_order.clear();
    }
    hits_.store(0);
    misses_.store(0);
    evictions_.store(0);
    EYEMAP_LOG_DEBUG("Grid cache cleared, %zu entries evicted", evicted);
    return evicted;
}

CacheStatistics ShardedGridCache::statistics() const {
    CacheStatistics stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);
    for (const auto& shard : shards_) {
        std::shared_lock<std::shared_mutex> lock(shard->mutex);
        stats.entries += shard->entries.size();
    }
    return stats;
}

std::uint64_t grid_fingerprint(const std::vector<PossibleColumn>& lattice, const DataMap& observed,
                               const std::string& region, const MinMaxData* min_max_data, MetricType metric) {
    std::uint64_t h = FNV_OFFSET;

    // The whole lattice shapes the outline, so every entry counts
    for (const auto& column : lattice) {
        h = fnv_hash(h, column.region);
        h = fnv_hash(h, static_cast<std::uint64_t>(column.side));
        h = fnv_hash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(column.hex1)));
        h = fnv_hash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(column.hex2)));
    }

    for (const auto& [key, obs] : observed) {
        if (key.region != region) continue;
        h = fnv_hash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(key.hex1)));
        h = fnv_hash(h, static_cast<std::uint64_t>(static_cast<std::int64_t>(key.hex2)));
        h = fnv_hash(h, obs.synapse_count);
        h = fnv_hash(h, obs.neuron_count);
        h = fnv_hash(h, static_cast<std::uint64_t>(obs.layers.size()));
        for (const auto& layer : obs.layers) {
            h = fnv_hash(h, layer.synapse_count);
            h = fnv_hash(h, layer.neuron_count);
        }
    }

    if (min_max_data != nullptr) {
        if (const ValueRange* range = min_max_data->find(metric, region)) {
            h = fnv_hash(h, range->min_value);
            h = fnv_hash(h, range->max_value);
        }
    }
    return h;
}

std::string threshold_signature(const Thresholds* thresholds) {
    if (thresholds == nullptr || thresholds->values.empty()) {
        return "default";
    }
    std::string out;
    for (std::size_t i = 0; i < thresholds->values.size(); ++i) {
        if (i > 0) out += ',';
        out += format_double(thresholds->values[i]);
    }
    return out;
}

} // namespace eyemap
