#include <eyemap/color_palette.hpp>
#include <eyemap/eyemap_generator.hpp>
#include <eyemap/log.hpp>
#include <chrono>

namespace eyemap {

EyemapServices::EyemapServices(const EyemapConfig& config)
    : coordinates(config.hex_size, config.spacing_factor)
    , colors()
    , processor()
    , tooltips()
    , layout(config)
    , rendering(config, coordinates, colors, layout) {}

std::unique_ptr<EyemapServices> make_services(const EyemapConfig& config) {
    return std::make_unique<EyemapServices>(config);
}

Result<std::unique_ptr<EyemapGenerator>> EyemapGenerator::create(const EyemapConfig& config) {
    if (auto status = validate_config(config); !status) {
        EYEMAP_LOG_ERROR("Invalid configuration: %s", status.error().to_string().c_str());
        return status.error();
    }
    std::shared_ptr<GridCache> cache;
    if (config.enable_cache) {
        cache = std::make_shared<ShardedGridCache>(ShardedGridCache::DEFAULT_SHARD_COUNT,
                                                   config.cache_max_entries);
    }
    return std::make_unique<EyemapGenerator>(config, make_services(config), std::move(cache));
}

EyemapGenerator::EyemapGenerator(EyemapConfig config, std::unique_ptr<EyemapServices> services,
                                 std::shared_ptr<GridCache> cache)
    : config_(std::move(config))
    , services_(std::move(services))
    , cache_(std::move(cache)) {
    if (!services_) {
        services_ = make_services(config_);
    }
    if (config_.worker_threads != 1) {
        pool_ = std::make_unique<job_system::JobSystem<JobKind>>(config_.worker_threads);
        pool_->start();
    }
}

EyemapGenerator::~EyemapGenerator() {
    if (pool_) {
        pool_->shutdown();
    }
}

std::string EyemapGenerator::plot_description(MetricType metric) {
    return metric == MetricType::SynapseDensity ? "Synapses (All Columns)" : "Cell Count (All Columns)";
}

Result<std::vector<Color>> EyemapGenerator::layer_colors(const ProcessedColumn& column,
                                                         const SingleRegionGridRequest& request) const {
    if (column.status != ColumnStatus::HasData) {
        return std::vector<Color>(column.layer_values.size(), ColorMapper::status_color(column.status));
    }

    const ValueRange* global = request.min_max_data != nullptr
        ? request.min_max_data->find(request.metric_type, request.region_name)
        : nullptr;
    if (global == nullptr) {
        return std::vector<Color>(column.layer_values.size(), colors::WHITE);
    }

    const Thresholds bounds{{global->min_value, global->max_value}};
    auto range = services_->processor.determine_value_range(&bounds);
    if (!range) return range.error();

    std::vector<Color> out;
    out.reserve(column.layer_values.size());
    for (double v : column.layer_values) {
        out.push_back(v > 0.0 ? services_->colors.map_value_to_color(v, range.value()) : colors::WHITE);
    }
    return out;
}

Result<HexagonGrid> EyemapGenerator::build_grid(const SingleRegionGridRequest& request) const {
    if (auto status = validator_.validate_single_region_request(request); !status) {
        return status.error();
    }

    auto processed = services_->processor.process(request);
    if (!processed) return processed.error();
    const ProcessingResult& data = processed.value();

    const bool mirror = CoordinateSystem::mirror_for(request.side);
    const char* side_label = short_label(request.side);

    HexagonGrid grid;
    grid.region = request.region_name;
    grid.side = request.side;
    grid.metric = request.metric_type;
    grid.value_range = data.value_range;
    grid.plot_desc = plot_description(request.metric_type);
    grid.region_desc = request.region_name + " (" + side_label + ")";
    grid.neuron_desc = request.neuron_type + " (" + side_label + ")";
    grid.hexagons.reserve(data.processed_columns.size());

    for (const auto& column : data.processed_columns) {
        const PixelPoint p = services_->coordinates.to_pixel(column.hex1, column.hex2, mirror);

        HexagonDescriptor hexagon;
        hexagon.hex1 = column.hex1;
        hexagon.hex2 = column.hex2;
        hexagon.pixel_x = p.x;
        hexagon.pixel_y = p.y;
        hexagon.value = column.value;
        hexagon.layer_values = column.layer_values;
        hexagon.status = column.status;
        hexagon.region = request.region_name;
        hexagon.side = request.side;
        hexagon.color = column.status == ColumnStatus::HasData
            ? services_->colors.map_value_to_color(column.value.value_or(0.0), data.value_range)
            : ColorMapper::status_color(column.status);

        auto layers = layer_colors(column, request);
        if (!layers) return layers.error();
        hexagon.layer_colors = std::move(layers).value();

        grid.hexagons.push_back(std::move(hexagon));
    }

    services_->tooltips.attach(grid);

    EYEMAP_LOG_DEBUG("Built %s_%s %s: %zu has data, %zu no data, %zu not in region",
                     grid.region.c_str(), side_label, to_string(grid.metric),
                     data.counts.has_data, data.counts.no_data, data.counts.not_in_region);
    return grid;
}

Result<std::string> EyemapGenerator::cached_content(const SingleRegionGridRequest& request,
                                                    const RenderingRequest& rendering) const {
    const RenderingManager& renderer = services_->rendering;
    if (!cache_) {
        return renderer.render_content(rendering);
    }

    GridCacheKey key;
    key.region = request.region_name;
    key.side = request.side;
    key.metric = request.metric_type;
    key.neuron_type = request.neuron_type;
    key.threshold_signature = threshold_signature(request.thresholds);
    key.format = request.output_format;
    key.fingerprint = grid_fingerprint(*request.all_possible_columns, *request.data_map, request.region_name,
                                       request.min_max_data, request.metric_type);

    if (auto hit = cache_->get(key)) {
        EYEMAP_LOG_DEBUG("Cache hit for %s", key.to_string().c_str());
        return std::move(*hit);
    }

    auto content = renderer.render_content(rendering);
    if (!content) return content;

    if (auto status = cache_->put(key, content.value()); !status) {
        EYEMAP_LOG_WARN("%s", status.error().to_string().c_str());
    }
    return content;
}

Result<Artifact> EyemapGenerator::generate_single_region_grid(const SingleRegionGridRequest& request) const {
    auto grid = build_grid(request);
    if (!grid) return grid.error();

    RenderingRequest rendering;
    rendering.grid = &grid.value();
    rendering.output_format = request.output_format;
    rendering.save_to_file = request.save_to_file;

    auto content = cached_content(request, rendering);
    if (!content) return content.error();

    auto artifact = services_->rendering.finalize(rendering, content.value());
    if (!artifact) return artifact.error();

    if (auto status = runtime_.validate_result_integrity(artifact.value(), "generate_single_region_grid"); !status) {
        return status.error();
    }
    return artifact;
}

void EyemapGenerator::run_pair(const GridGenerationRequest& request, const SideDataMaps& maps,
                               const RegionSideKey& key, PairOutcome& outcome) const {
    for (MetricType metric : request.metrics) {
        SingleRegionGridRequest single;
        single.all_possible_columns = &request.all_possible_columns;
        single.data_map = &maps.for_side(key.side);
        single.region_name = key.region;
        single.side = key.side;
        single.metric_type = metric;
        single.neuron_type = request.neuron_type;
        single.thresholds = request.thresholds.find(metric, key.region);
        single.min_max_data = request.min_max_data ? &*request.min_max_data : nullptr;
        single.output_format = request.output_format;
        single.save_to_file = request.save_to_files;

        auto artifact = generate_single_region_grid(single);
        if (artifact) {
            outcome.artifacts.emplace(metric, std::move(artifact).value());
            continue;
        }

        outcome.warnings.push_back(key.to_string() + ": " + artifact.error().to_string());
        if (artifact.error().kind != ErrorKind::Rendering) {
            // Data and validation errors invalidate the whole pair
            outcome.artifacts.clear();
            break;
        }
    }
    outcome.completed = true;
}

GridGenerationResult EyemapGenerator::generate(const GridGenerationRequest& request) {
    std::lock_guard<std::mutex> batch_lock(batch_mutex_);
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    GridGenerationResult result;

    if (auto status = validator_.validate_grid_generation_request(request); !status) {
        result.success = false;
        result.error_message = "Request validation failed: " + status.error().to_string();
        result.processing_time = elapsed();
        EYEMAP_LOG_ERROR("%s", result.error_message->c_str());
        return result;
    }

    result.success = true;

    OrganizedObservations organized = services_->processor.organize_observations(request.column_data);
    const SideDataMaps& side_maps = organized.maps;
    for (const auto& fault : organized.faults) {
        if (!fault.region.empty()) continue;
        result.warnings.push_back("column_data: " + fault.error.to_string());
        EYEMAP_LOG_WARN("%s", result.warnings.back().c_str());
    }

    std::vector<RegionSideKey> pairs;
    for (const auto& region : request.regions()) {
        for (Hemisphere side : sides_for(request.soma_side)) {
            pairs.push_back(RegionSideKey{region, side});
        }
    }

    // A bad observation fails its own pair before any rendering
    std::vector<PairOutcome> outcomes(pairs.size());
    for (std::size_t i = 0; i < pairs.size(); ++i) {
        if (const Error* fault = organized.fault_for(pairs[i].region, pairs[i].side)) {
            outcomes[i].warnings.push_back(pairs[i].to_string() + ": " + fault->to_string());
            outcomes[i].completed = true;
        }
    }

    if (!pool_ || pairs.size() <= 1) {
        for (std::size_t i = 0; i < pairs.size(); ++i) {
            if (outcomes[i].completed) continue;
            run_pair(request, side_maps, pairs[i], outcomes[i]);
        }
    } else {
        for (std::size_t i = 0; i < pairs.size(); ++i) {
            if (outcomes[i].completed) continue;
            pool_->submit_function([this, &request, &side_maps, &pairs, &outcomes, i] {
                run_pair(request, side_maps, pairs[i], outcomes[i]);
            }, JobKind::RegionSide);
        }
        pool_->wait_for_completion();

        if (auto failure = pool_->first_error()) {
            EYEMAP_LOG_ERROR("%zu grid job(s) failed, first: %s", pool_->get_failed_count(), failure->c_str());
            pool_->clear_error();
        }
    }

    for (std::size_t i = 0; i < pairs.size(); ++i) {
        PairOutcome& outcome = outcomes[i];
        if (!outcome.completed) {
            Error e = make_error(ErrorKind::Performance, "grid job did not complete", "generate");
            outcome.warnings.push_back(pairs[i].to_string() + ": " + e.to_string());
            outcome.artifacts.clear();
        }
        for (auto& warning : outcome.warnings) {
            EYEMAP_LOG_WARN("%s", warning.c_str());
            result.warnings.push_back(std::move(warning));
        }
        if (!outcome.artifacts.empty()) {
            result.region_grids.emplace(pairs[i], std::move(outcome.artifacts));
        }
    }

    result.processing_time = elapsed();
    EYEMAP_LOG_DEBUG("Generated %zu of %zu grids for %s in %.3fs (%zu warnings)",
                     result.region_grids.size(), pairs.size(), request.neuron_type.c_str(),
                     result.processing_time, result.warnings.size());
    return result;
}

std::size_t EyemapGenerator::clear_cache() {
    return cache_ ? cache_->clear() : 0;
}

std::optional<CacheStatistics> EyemapGenerator::cache_statistics() const {
    if (!cache_) return std::nullopt;
    return cache_->statistics();
}

} // namespace eyemap
