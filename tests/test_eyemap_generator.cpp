#include <gtest/gtest.h>
#include <eyemap/color_palette.hpp>
#include <eyemap/eyemap_generator.hpp>
#include "test_helpers.hpp"
#include <filesystem>

using namespace eyemap;
using test_utils::find_hexagon;
using test_utils::make_lattice;
using test_utils::make_observation;

namespace {

// ME and LOP on both sides, with a few observations on each
GridGenerationRequest two_region_request() {
    GridGenerationRequest request;
    request.neuron_type = "Mi1";
    request.soma_side = SomaSide::Combined;

    test_utils::append(request.all_possible_columns, make_lattice("ME", Hemisphere::Left, {{0, 0}, {1, 0}, {1, 1}}));
    test_utils::append(request.all_possible_columns, make_lattice("ME", Hemisphere::Right, {{0, 0}, {0, 1}, {1, 1}}));
    test_utils::append(request.all_possible_columns, make_lattice("LOP", Hemisphere::Left, {{2, 2}, {2, 3}}));
    test_utils::append(request.all_possible_columns, make_lattice("LOP", Hemisphere::Right, {{2, 2}, {3, 2}}));

    request.column_data = {
        make_observation("ME", Hemisphere::Left, 0, 0, 12.0, 3.0),
        make_observation("ME", Hemisphere::Right, 1, 1, 4.0, 1.0),
        make_observation("LOP", Hemisphere::Left, 2, 3, 8.0, 2.0),
        make_observation("LOP", Hemisphere::Right, 2, 2, 1.0, 1.0),
    };
    request.thresholds.set(MetricType::SynapseDensity, "ME", Thresholds{{0.0, 20.0}});
    request.thresholds.set(MetricType::CellCount, "ME", Thresholds{{0.0, 5.0}});
    return request;
}

// Remembers nothing and refuses every write
class RejectingCache : public GridCache {
public:
    std::optional<std::string> get(const GridCacheKey&) override { return std::nullopt; }
    Status put(const GridCacheKey&, std::string) override {
        ++puts;
        return make_error(ErrorKind::Performance, "cache is full", "cache_put");
    }
    std::size_t clear() override { return 0; }
    CacheStatistics statistics() const override { return CacheStatistics{}; }

    std::size_t puts = 0;
};

} // namespace

class EyemapGeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config = test_utils::test_config(dir.str());
        generator = test_utils::make_generator(config);
    }

    test_utils::TempDir dir;
    test_utils::MeFixtureData data;
    EyemapConfig config;
    std::unique_ptr<EyemapGenerator> generator;
};

TEST_F(EyemapGeneratorTest, SingleObservationColorsAtGradientMidpoint) {
    auto grid = generator->build_grid(data.request());
    ASSERT_TRUE(grid.ok()) << grid.error().to_string();
    ASSERT_EQ(grid.value().hexagons.size(), 3u);

    const HexagonDescriptor* observed = find_hexagon(grid.value(), 0, 0);
    ASSERT_NE(observed, nullptr);
    EXPECT_EQ(observed->status, ColumnStatus::HasData);
    EXPECT_EQ(observed->color.to_hex(), "#fc9272");

    for (auto [h1, h2] : {std::pair<int, int>{1, 0}, std::pair<int, int>{0, 1}}) {
        const HexagonDescriptor* empty = find_hexagon(grid.value(), h1, h2);
        ASSERT_NE(empty, nullptr);
        EXPECT_EQ(empty->status, ColumnStatus::NoData);
        EXPECT_EQ(empty->color, colors::WHITE);
        EXPECT_FALSE(empty->value.has_value());
    }
}

TEST_F(EyemapGeneratorTest, CellOfAnotherRegionIsNotInRegion) {
    data.lattice = make_lattice("ME", Hemisphere::Right, {{0, 0}, {0, 1}});
    test_utils::append(data.lattice, make_lattice("LO", Hemisphere::Right, {{1, 0}}));

    auto grid = generator->build_grid(data.request());
    ASSERT_TRUE(grid.ok()) << grid.error().to_string();

    const HexagonDescriptor* outside = find_hexagon(grid.value(), 1, 0);
    ASSERT_NE(outside, nullptr);
    EXPECT_EQ(outside->status, ColumnStatus::NotInRegion);
    EXPECT_EQ(outside->color, colors::DARK_GRAY);
    EXPECT_EQ(outside->tooltip, "Column: 1, 0\nColumn not identified in ME (R)");

    EXPECT_EQ(find_hexagon(grid.value(), 0, 1)->status, ColumnStatus::NoData);
}

TEST_F(EyemapGeneratorTest, DegenerateThresholdRendersMidpoint) {
    data.thresholds = Thresholds{{7.0, 7.0}};
    data.observations = {make_observation("ME", Hemisphere::Right, 0, 0, 7.0)};
    data.data_map = test_utils::make_data_map(data.observations);

    auto grid = generator->build_grid(data.request());
    ASSERT_TRUE(grid.ok()) << grid.error().to_string();
    EXPECT_LT(grid.value().value_range.min_value, grid.value().value_range.max_value);
    EXPECT_EQ(find_hexagon(grid.value(), 0, 0)->color.to_hex(), "#fc9272");

    auto artifact = generator->generate_single_region_grid(data.request());
    EXPECT_TRUE(artifact.ok()) << artifact.error().to_string();
}

TEST_F(EyemapGeneratorTest, RightSideIsMirrored) {
    auto right = generator->build_grid(data.request());
    auto left_request = data.request();
    data.lattice = make_lattice("ME", Hemisphere::Left, {{0, 0}, {1, 0}, {0, 1}});
    left_request.side = Hemisphere::Left;
    auto left = generator->build_grid(left_request);
    ASSERT_TRUE(right.ok());
    ASSERT_TRUE(left.ok()) << left.error().to_string();

    const HexagonDescriptor* r = find_hexagon(right.value(), 1, 0);
    const HexagonDescriptor* l = find_hexagon(left.value(), 1, 0);
    ASSERT_NE(r, nullptr);
    ASSERT_NE(l, nullptr);
    EXPECT_DOUBLE_EQ(r->pixel_x, -l->pixel_x);
    EXPECT_DOUBLE_EQ(r->pixel_y, l->pixel_y);
}

TEST_F(EyemapGeneratorTest, GridDescriptions) {
    auto grid = generator->build_grid(data.request(MetricType::CellCount));
    ASSERT_TRUE(grid.ok());
    EXPECT_EQ(grid.value().plot_desc, "Cell Count (All Columns)");
    EXPECT_EQ(grid.value().region_desc, "ME (R)");
    EXPECT_EQ(grid.value().neuron_desc, "T4a (R)");
    EXPECT_EQ(find_hexagon(grid.value(), 0, 0)->tooltip, "Column: 0, 0\nCell count: 2\nROI: ME (R)");
}

TEST_F(EyemapGeneratorTest, LayerColorsUseGlobalRange) {
    data.observations = {make_observation("ME", Hemisphere::Right, 0, 0, 5.0, 2.0, {{2.0, 1.0}, {0.0, 0.0}})};
    data.data_map = test_utils::make_data_map(data.observations);

    auto request = data.request();
    auto white = generator->build_grid(request);
    ASSERT_TRUE(white.ok());
    const HexagonDescriptor* h = find_hexagon(white.value(), 0, 0);
    ASSERT_EQ(h->layer_colors.size(), 2u);
    EXPECT_EQ(h->layer_colors[0], colors::WHITE);
    EXPECT_EQ(h->layer_colors[1], colors::WHITE);

    MinMaxData min_max;
    min_max.synapses_by_region["ME"] = ValueRange{0.0, 4.0};
    request.min_max_data = &min_max;
    auto colored = generator->build_grid(request);
    ASSERT_TRUE(colored.ok());
    h = find_hexagon(colored.value(), 0, 0);
    ASSERT_EQ(h->layer_colors.size(), 2u);
    EXPECT_EQ(h->layer_colors[0].to_hex(), "#fc9272");
    EXPECT_EQ(h->layer_colors[1], colors::WHITE);
    EXPECT_EQ(h->tooltip_layers.size(), 2u);

    // Cells without data repeat their status color per layer
    const HexagonDescriptor* empty = find_hexagon(colored.value(), 1, 0);
    ASSERT_EQ(empty->layer_colors.size(), 2u);
    EXPECT_EQ(empty->layer_colors[0], colors::WHITE);
}

TEST_F(EyemapGeneratorTest, SingleRegionErrorsAreReturned) {
    auto request = data.request();
    request.region_name = "LOP";
    auto artifact = generator->generate_single_region_grid(request);
    ASSERT_FALSE(artifact.ok());
    EXPECT_EQ(artifact.error().kind, ErrorKind::DataProcessing);

    request = data.request();
    request.data_map = nullptr;
    artifact = generator->generate_single_region_grid(request);
    ASSERT_FALSE(artifact.ok());
    EXPECT_EQ(artifact.error().kind, ErrorKind::Validation);

    request = data.request();
    request.region_name.clear();
    artifact = generator->generate_single_region_grid(request);
    ASSERT_FALSE(artifact.ok());
    EXPECT_EQ(artifact.error().kind, ErrorKind::Validation);
}

TEST_F(EyemapGeneratorTest, CombinedProducesIndependentSides) {
    GridGenerationRequest request;
    request.neuron_type = "T4a";
    request.soma_side = SomaSide::Combined;
    request.all_possible_columns = make_lattice("ME", Hemisphere::Left, {{0, 0}, {1, 0}});
    test_utils::append(request.all_possible_columns, make_lattice("ME", Hemisphere::Right, {{0, 0}, {0, 1}}));
    request.column_data = {make_observation("ME", Hemisphere::Left, 1, 0, 3.0),
                           make_observation("ME", Hemisphere::Right, 0, 1, 9.0)};

    GridGenerationResult result = generator->generate(request);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_GE(result.processing_time, 0.0);
    ASSERT_EQ(result.region_grids.size(), 2u);

    for (Hemisphere side : {Hemisphere::Left, Hemisphere::Right}) {
        auto it = result.region_grids.find(RegionSideKey{"ME", side});
        ASSERT_NE(it, result.region_grids.end());
        ASSERT_EQ(it->second.size(), 2u);
        for (const auto& [metric, artifact] : it->second) {
            EXPECT_EQ(artifact.kind, ArtifactKind::InlineSvg);
            EXPECT_NE(artifact.content.find("<svg"), std::string::npos);
        }
    }

    // Each side is classified against its own lattice
    auto left_request = SingleRegionGridRequest{};
    auto maps = generator->services().processor.organize_by_side(request.column_data);
    ASSERT_TRUE(maps.ok());
    left_request.all_possible_columns = &request.all_possible_columns;
    left_request.data_map = &maps.value().left;
    left_request.region_name = "ME";
    left_request.side = Hemisphere::Left;
    left_request.neuron_type = "T4a";
    auto left = generator->build_grid(left_request);
    ASSERT_TRUE(left.ok()) << left.error().to_string();
    EXPECT_EQ(find_hexagon(left.value(), 1, 0)->status, ColumnStatus::HasData);
    EXPECT_EQ(find_hexagon(left.value(), 0, 0)->status, ColumnStatus::NoData);
    EXPECT_EQ(find_hexagon(left.value(), 0, 1)->status, ColumnStatus::NotInRegion);
}

TEST_F(EyemapGeneratorTest, MissingSideBecomesWarning) {
    GridGenerationRequest request;
    request.neuron_type = "T4a";
    request.soma_side = SomaSide::Combined;
    request.all_possible_columns = data.lattice;   // ME, right side only
    request.column_data = data.observations;

    GridGenerationResult result = generator->generate(request);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.error_message.has_value());
    ASSERT_EQ(result.region_grids.size(), 1u);
    EXPECT_EQ(result.region_grids.count(RegionSideKey{"ME", Hemisphere::Right}), 1u);
    EXPECT_EQ(result.region_grids.count(RegionSideKey{"ME", Hemisphere::Left}), 0u);

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].rfind("ME_L: DataProcessingError", 0), 0u) << result.warnings[0];
}

TEST_F(EyemapGeneratorTest, InvalidRequestFailsWithoutGrids) {
    GridGenerationRequest request = two_region_request();
    request.neuron_type.clear();

    GridGenerationResult result = generator->generate(request);
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error_message.has_value());
    EXPECT_EQ(result.error_message->rfind("Request validation failed: ", 0), 0u);
    EXPECT_TRUE(result.region_grids.empty());
}

TEST_F(EyemapGeneratorTest, DuplicateObservationFailsOnlyItsPair) {
    GridGenerationRequest request = two_region_request();
    request.column_data.push_back(make_observation("ME", Hemisphere::Left, 0, 0, 1.0));

    GridGenerationResult result = generator->generate(request);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.region_grids.size(), 3u);
    EXPECT_EQ(result.region_grids.count(RegionSideKey{"ME", Hemisphere::Left}), 0u);
    EXPECT_EQ(result.region_grids.count(RegionSideKey{"ME", Hemisphere::Right}), 1u);
    EXPECT_EQ(result.region_grids.count(RegionSideKey{"LOP", Hemisphere::Left}), 1u);
    EXPECT_EQ(result.region_grids.count(RegionSideKey{"LOP", Hemisphere::Right}), 1u);

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].rfind("ME_L: DataProcessingError", 0), 0u) << result.warnings[0];
    EXPECT_NE(result.warnings[0].find("duplicate column observation"), std::string::npos);
}

TEST_F(EyemapGeneratorTest, DuplicateInOneRegionLeavesOtherRegionRendered) {
    GridGenerationRequest request;
    request.neuron_type = "T4a";
    request.soma_side = SomaSide::Left;
    request.all_possible_columns = make_lattice("ME", Hemisphere::Left, {{0, 0}, {1, 0}});
    test_utils::append(request.all_possible_columns, make_lattice("LO", Hemisphere::Left, {{0, 1}, {1, 1}}));
    request.column_data = {make_observation("ME", Hemisphere::Left, 0, 0, 2.0),
                           make_observation("ME", Hemisphere::Left, 0, 0, 3.0),
                           make_observation("LO", Hemisphere::Left, 0, 1, 4.0)};

    GridGenerationResult result = generator->generate(request);
    EXPECT_TRUE(result.success);
    ASSERT_EQ(result.region_grids.size(), 1u);
    auto it = result.region_grids.find(RegionSideKey{"LO", Hemisphere::Left});
    ASSERT_NE(it, result.region_grids.end());
    EXPECT_EQ(it->second.size(), 2u);

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].rfind("ME_L: DataProcessingError", 0), 0u) << result.warnings[0];
}

TEST_F(EyemapGeneratorTest, ObservationWithoutRegionIsReportedAndSkipped) {
    GridGenerationRequest request = two_region_request();
    request.column_data.push_back(make_observation("", Hemisphere::Right, 5, 5, 1.0));

    GridGenerationResult result = generator->generate(request);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.region_grids.size(), 4u);
    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].rfind("column_data: DataProcessingError", 0), 0u) << result.warnings[0];
}

TEST_F(EyemapGeneratorTest, SingleSideRequestRendersOnlyThatSide) {
    GridGenerationRequest request = two_region_request();
    request.soma_side = SomaSide::Left;
    request.metrics = {MetricType::CellCount};

    GridGenerationResult result = generator->generate(request);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.region_grids.size(), 2u);
    for (const auto& [key, artifacts] : result.region_grids) {
        EXPECT_EQ(key.side, Hemisphere::Left);
        ASSERT_EQ(artifacts.size(), 1u);
        EXPECT_EQ(artifacts.begin()->first, MetricType::CellCount);
    }
}

TEST_F(EyemapGeneratorTest, OutputIsDeterministicAcrossGenerators) {
    auto other = test_utils::make_generator(config);
    GridGenerationResult a = generator->generate(two_region_request());
    GridGenerationResult b = other->generate(two_region_request());
    ASSERT_TRUE(a.success);
    ASSERT_TRUE(b.success);
    ASSERT_EQ(a.region_grids.size(), 4u);
    ASSERT_EQ(a.region_grids.size(), b.region_grids.size());

    for (const auto& [key, artifacts] : a.region_grids) {
        const auto& other_artifacts = b.region_grids.at(key);
        for (const auto& [metric, artifact] : artifacts) {
            EXPECT_EQ(artifact.content, other_artifacts.at(metric).content) << key.to_string();
        }
    }
}

TEST_F(EyemapGeneratorTest, PooledBatchMatchesInlineBatch) {
    auto pooled = test_utils::make_generator(test_utils::test_config(dir.str(), 4));
    GridGenerationResult inline_result = generator->generate(two_region_request());
    GridGenerationResult pooled_result = pooled->generate(two_region_request());

    ASSERT_TRUE(pooled_result.success);
    EXPECT_EQ(pooled_result.warnings, inline_result.warnings);
    ASSERT_EQ(pooled_result.region_grids.size(), inline_result.region_grids.size());
    for (const auto& [key, artifacts] : inline_result.region_grids) {
        auto it = pooled_result.region_grids.find(key);
        ASSERT_NE(it, pooled_result.region_grids.end()) << key.to_string();
        for (const auto& [metric, artifact] : artifacts) {
            EXPECT_EQ(artifact.content, it->second.at(metric).content);
        }
    }
}

TEST_F(EyemapGeneratorTest, PooledGeneratorRunsRepeatedBatches) {
    auto pooled = test_utils::make_generator(test_utils::test_config(dir.str(), 3));
    for (int i = 0; i < 5; ++i) {
        GridGenerationResult result = pooled->generate(two_region_request());
        ASSERT_TRUE(result.success);
        EXPECT_EQ(result.region_grids.size(), 4u);
    }
}

TEST_F(EyemapGeneratorTest, CacheIsTransparent) {
    auto cache = std::make_shared<ShardedGridCache>();
    auto cached = test_utils::make_generator(config, cache);
    EXPECT_TRUE(cached->caching_enabled());
    EXPECT_FALSE(generator->caching_enabled());
    EXPECT_FALSE(generator->cache_statistics().has_value());

    GridGenerationResult reference = generator->generate(two_region_request());
    GridGenerationResult first = cached->generate(two_region_request());
    GridGenerationResult second = cached->generate(two_region_request());

    auto stats = cached->cache_statistics();
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->entries, 8u);
    EXPECT_EQ(stats->hits, 8u);

    for (const auto* result : {&first, &second}) {
        ASSERT_EQ(result->region_grids.size(), reference.region_grids.size());
        for (const auto& [key, artifacts] : reference.region_grids) {
            for (const auto& [metric, artifact] : artifacts) {
                EXPECT_EQ(result->region_grids.at(key).at(metric).content, artifact.content);
            }
        }
    }

    EXPECT_EQ(cached->clear_cache(), 8u);
    EXPECT_EQ(generator->clear_cache(), 0u);
}

TEST_F(EyemapGeneratorTest, FailingCacheWriteLeavesOutputUnchanged) {
    auto cache = std::make_shared<RejectingCache>();
    auto cached = test_utils::make_generator(config, cache);

    GridGenerationResult reference = generator->generate(two_region_request());
    GridGenerationResult result = cached->generate(two_region_request());

    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_EQ(cache->puts, 8u);
    ASSERT_EQ(result.region_grids.size(), reference.region_grids.size());
    for (const auto& [key, artifacts] : reference.region_grids) {
        ASSERT_EQ(result.region_grids.at(key).size(), artifacts.size());
        for (const auto& [metric, artifact] : artifacts) {
            EXPECT_EQ(result.region_grids.at(key).at(metric).content, artifact.content) << key.to_string();
        }
    }
}

TEST_F(EyemapGeneratorTest, CacheMissesWhenObservationsChange) {
    auto cached = test_utils::make_generator(config, std::make_shared<ShardedGridCache>());
    auto request = two_region_request();
    GridGenerationResult first = cached->generate(request);

    request.column_data[0].synapse_count = 19.0;
    GridGenerationResult second = cached->generate(request);
    GridGenerationResult fresh = generator->generate(request);

    const RegionSideKey me_left{"ME", Hemisphere::Left};
    EXPECT_NE(first.region_grids.at(me_left).at(MetricType::SynapseDensity).content,
              second.region_grids.at(me_left).at(MetricType::SynapseDensity).content);
    EXPECT_EQ(second.region_grids.at(me_left).at(MetricType::SynapseDensity).content,
              fresh.region_grids.at(me_left).at(MetricType::SynapseDensity).content);
}

TEST_F(EyemapGeneratorTest, SaveModeWritesFiles) {
    GridGenerationRequest request = two_region_request();
    request.save_to_files = true;
    request.output_format = OutputFormat::Png;

    GridGenerationResult result = generator->generate(request);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.region_grids.size(), 4u);
    for (const auto& [key, artifacts] : result.region_grids) {
        for (const auto& [metric, artifact] : artifacts) {
            EXPECT_EQ(artifact.kind, ArtifactKind::File);
            EXPECT_TRUE(std::filesystem::exists(artifact.content)) << artifact.content;
            EXPECT_EQ(std::filesystem::path(artifact.content).extension(), ".png");
        }
    }
    EXPECT_TRUE(std::filesystem::exists(config.eyemaps_dir() + "/Synapses_All_Columns_ME_L_Mi1_L.png"));
    EXPECT_TRUE(std::filesystem::exists(config.eyemaps_dir() + "/Cell_Count_All_Columns_LOP_R_Mi1_R.png"));
}

TEST_F(EyemapGeneratorTest, RenderingErrorDropsOnlyThatMetric) {
    GridGenerationRequest request = two_region_request();
    request.save_to_files = true;

    // A directory squatting on one artifact's file name makes that save fail
    const std::string blocked = config.eyemaps_dir() + "/Cell_Count_All_Columns_ME_L_Mi1_L.svg";
    std::filesystem::create_directories(blocked + "/occupied");

    GridGenerationResult result = generator->generate(request);
    ASSERT_TRUE(result.success);
    ASSERT_EQ(result.region_grids.size(), 4u);

    const auto& me_left = result.region_grids.at(RegionSideKey{"ME", Hemisphere::Left});
    ASSERT_EQ(me_left.size(), 1u);
    EXPECT_EQ(me_left.count(MetricType::SynapseDensity), 1u);
    EXPECT_TRUE(std::filesystem::exists(me_left.at(MetricType::SynapseDensity).content));

    for (const auto& [key, artifacts] : result.region_grids) {
        if (key == RegionSideKey{"ME", Hemisphere::Left}) continue;
        EXPECT_EQ(artifacts.size(), 2u) << key.to_string();
    }

    ASSERT_EQ(result.warnings.size(), 1u);
    EXPECT_EQ(result.warnings[0].rfind("ME_L: RenderingError", 0), 0u) << result.warnings[0];
}

TEST_F(EyemapGeneratorTest, OversizedLatticeSpanBecomesRenderingWarning) {
    GridGenerationRequest request;
    request.neuron_type = "T4a";
    request.soma_side = SomaSide::Right;
    request.output_format = OutputFormat::Png;
    request.all_possible_columns = make_lattice("ME", Hemisphere::Right, {{0, 0}, {2000000, 0}});
    request.column_data = {make_observation("ME", Hemisphere::Right, 0, 0, 5.0)};

    GridGenerationResult result;
    ASSERT_NO_THROW(result = generator->generate(request));
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.region_grids.empty());

    ASSERT_EQ(result.warnings.size(), 2u);
    for (const auto& warning : result.warnings) {
        EXPECT_EQ(warning.rfind("ME_R: RenderingError", 0), 0u) << warning;
        EXPECT_NE(warning.find("canvas exceeds the maximum size"), std::string::npos) << warning;
    }
}

TEST_F(EyemapGeneratorTest, PngEmbedding) {
    GridGenerationRequest request = two_region_request();
    request.output_format = OutputFormat::Png;

    GridGenerationResult result = generator->generate(request);
    ASSERT_TRUE(result.success);
    for (const auto& [key, artifacts] : result.region_grids) {
        for (const auto& [metric, artifact] : artifacts) {
            EXPECT_EQ(artifact.kind, ArtifactKind::InlinePng);
            EXPECT_EQ(artifact.content.rfind("data:image/png;base64,", 0), 0u);
        }
    }
}

TEST(EyemapGeneratorCreateTest, RejectsInvalidConfig) {
    EyemapConfig config;
    config.hex_size = -1.0;
    auto generator = EyemapGenerator::create(config);
    ASSERT_FALSE(generator.ok());
    EXPECT_EQ(generator.error().kind, ErrorKind::Validation);
    EXPECT_EQ(generator.error().field, "hex_size");
}

TEST(EyemapGeneratorCreateTest, BuildsCacheWhenEnabled) {
    test_utils::TempDir dir;
    auto generator = EyemapGenerator::create(test_utils::test_config(dir.str(), 2, true));
    ASSERT_TRUE(generator.ok()) << generator.error().to_string();
    EXPECT_TRUE(generator.value()->caching_enabled());

    auto plain = EyemapGenerator::create(test_utils::test_config(dir.str(), 1, false));
    ASSERT_TRUE(plain.ok());
    EXPECT_FALSE(plain.value()->caching_enabled());
}
