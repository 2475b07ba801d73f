/**
 * Eyemap Usage Example
 *
 * Renders a synthetic neuron type over a small hexagonal lattice:
 * - Building a lattice and column observations for both hemispheres
 * - Generating every region/side/metric grid in one batch
 * - Rendering a single grid directly
 *
 * Usage: eyemap_usage [output_dir] [svg|png]
 */

#include <eyemap/eyemap_generator.hpp>
#include <eyemap/log.hpp>
#include <cmath>
#include <iostream>
#include <string>

using namespace eyemap;

namespace {

// Roughly circular patch of the lattice centered on (c, c)
void add_region(GridGenerationRequest& request, const std::string& region, Hemisphere side, int radius) {
    const int c = radius;
    for (int hex1 = 0; hex1 <= 2 * radius; ++hex1) {
        for (int hex2 = 0; hex2 <= 2 * radius; ++hex2) {
            const int dq = hex1 - c;
            const int dr = hex2 - c;
            if (std::abs(dq) + std::abs(dr) + std::abs(dq + dr) <= 2 * radius) {
                request.all_possible_columns.push_back(PossibleColumn{region, side, hex1, hex2});
            }
        }
    }
}

// Deterministic synthetic counts, denser near the center, with a few gaps
void add_observations(GridGenerationRequest& request, const std::string& region, Hemisphere side,
                      std::size_t layers) {
    for (const auto& column : request.all_possible_columns) {
        if (column.region != region || column.side != side) continue;
        if ((column.hex1 * 7 + column.hex2 * 3) % 5 == 0) continue;

        ColumnObservation obs;
        obs.region = region;
        obs.side = side;
        obs.hex1 = column.hex1;
        obs.hex2 = column.hex2;
        obs.neuron_count = 1.0 + (column.hex1 + column.hex2) % 3;
        for (std::size_t layer = 0; layer < layers; ++layer) {
            const double synapses = static_cast<double>((column.hex1 * 13 + column.hex2 * 11 + layer * 5) % 17);
            obs.layers.push_back(LayerCounts{synapses, layer == 0 ? obs.neuron_count : 0.0});
            obs.synapse_count += synapses;
        }
        request.column_data.push_back(obs);
    }
}

} // namespace

int main(int argc, char** argv) {
    std::cout << "=== Eyemap Usage Example ===\n\n";

    EyemapConfig config;
    config.output_dir = argc > 1 ? argv[1] : "eyemap_output";
    config.worker_threads = 0;

    OutputFormat format = OutputFormat::Svg;
    if (argc > 2) {
        auto parsed = parse_output_format(argv[2]);
        if (!parsed) {
            std::cerr << parsed.error().to_string() << "\n";
            return 1;
        }
        format = parsed.value();
    }

    auto created = EyemapGenerator::create(config);
    if (!created) {
        std::cerr << created.error().to_string() << "\n";
        return 1;
    }
    EyemapGenerator& generator = *created.value();

    // Example 1: batch over ME, LO and LOP on both sides
    std::cout << "=== Example 1: Batch Generation ===\n";
    GridGenerationRequest request;
    request.neuron_type = "Tm3";
    request.soma_side = SomaSide::Combined;
    request.output_format = format;
    request.save_to_files = true;

    const struct {
        const char* region;
        int radius;
        std::size_t layers;
    } regions[] = {{"ME", 4, 10}, {"LO", 3, 7}, {"LOP", 3, 4}};

    for (const auto& r : regions) {
        for (Hemisphere side : {Hemisphere::Left, Hemisphere::Right}) {
            add_region(request, r.region, side, r.radius);
        }
    }
    for (const auto& r : regions) {
        for (Hemisphere side : {Hemisphere::Left, Hemisphere::Right}) {
            add_observations(request, r.region, side, r.layers);
        }
        request.thresholds.set(MetricType::SynapseDensity, r.region, Thresholds{{0.0, 40.0, 80.0}});
        request.thresholds.set(MetricType::CellCount, r.region, Thresholds{{0.0, 3.0}});
    }

    MinMaxData min_max;
    for (const auto& r : regions) {
        min_max.synapses_by_region[r.region] = ValueRange{0.0, 16.0};
        min_max.cells_by_region[r.region] = ValueRange{0.0, 3.0};
    }
    request.min_max_data = min_max;

    std::cout << request.all_possible_columns.size() << " lattice columns, "
              << request.column_data.size() << " observations\n";

    GridGenerationResult result = generator.generate(request);
    if (!result.success) {
        std::cerr << result.error_message.value_or("unknown error") << "\n";
        return 1;
    }
    for (const auto& [key, artifacts] : result.region_grids) {
        for (const auto& [metric, artifact] : artifacts) {
            std::cout << "  " << key.to_string() << " " << to_string(metric) << " -> " << artifact.content << "\n";
        }
    }
    for (const auto& warning : result.warnings) {
        std::cout << "  warning: " << warning << "\n";
    }
    std::cout << "Generated " << result.region_grids.size() << " region/side pairs in "
              << result.processing_time << "s\n\n";

    // Example 2: one grid, embedded
    std::cout << "=== Example 2: Single Region Grid ===\n";
    auto maps = generator.services().processor.organize_by_side(request.column_data);
    if (!maps) {
        std::cerr << maps.error().to_string() << "\n";
        return 1;
    }

    SingleRegionGridRequest single;
    single.all_possible_columns = &request.all_possible_columns;
    single.data_map = &maps.value().right;
    single.region_name = "LO";
    single.side = Hemisphere::Right;
    single.metric_type = MetricType::CellCount;
    single.neuron_type = request.neuron_type;
    single.thresholds = request.thresholds.find(MetricType::CellCount, "LO");

    auto artifact = generator.generate_single_region_grid(single);
    if (!artifact) {
        std::cerr << artifact.error().to_string() << "\n";
        return 1;
    }
    std::cout << "Embedded SVG: " << artifact.value().content.size() << " bytes\n";

    // Example 3: the second batch is served from the cache
    std::cout << "\n=== Example 3: Cached Batch ===\n";
    request.save_to_files = false;
    GridGenerationResult again = generator.generate(request);
    if (auto stats = generator.cache_statistics()) {
        std::cout << "Cache: " << stats->hits << " hits, " << stats->misses << " misses, "
                  << stats->entries << " entries\n";
    }
    std::cout << "Second batch took " << again.processing_time << "s\n";

    return 0;
}
