/**
 * @file test_extraction_orchestrator.cpp
 * @brief End-to-end extraction over on-disk rasters and zone layers
 */

#include "TestData.hpp"
#include "core/CodeMapping.hpp"
#include "core/CrsReconciler.hpp"
#include "core/ExtractionOrchestrator.hpp"
#include "ExtractionErrors.hpp"
#include <gtest/gtest.h>

using namespace rxgis;
using namespace rxgis::test;

namespace {

/**
 * Elevation pixel = row * 10 + col. Land cover is trees (10) west of
 * lon 0.5 and water (80) east of it. Zone 9 (stored first) covers the
 * south-east quarter and overlaps zone 7, which covers the west half.
 */
class ExtractionOrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        elevation_path_ = write_geotiff(dir_.file("dem.tif"), 10, 10, unit_degree_transform(),
                                        indexed_values(10, 10), 4326, -32768.0);

        std::vector<double> land_cover(100);
        for (int row = 0; row < 10; ++row) {
            for (int col = 0; col < 10; ++col) {
                land_cover[static_cast<size_t>(row * 10 + col)] = col < 5 ? 10.0 : 80.0;
            }
        }
        landcover_path_ = write_geotiff(dir_.file("worldcover.tif"), 10, 10, unit_degree_transform(),
                                        land_cover, 4326, std::nullopt, GDT_Byte);

        zone_path_ = write_zone_geojson(dir_.file("zones.geojson"),
                                        {box_zone(9, 0.4, 0.0, 1.0, 0.5), box_zone(7, 0.0, 0.0, 0.5, 1.0)});

        batch_.points = {
            make_point(0.05, 0.95, 1, 0, 0),   // row 0, col 0: trees, zone 7
            make_point(0.45, 0.25, 2, 0, 1),   // row 7, col 4: trees, overlap -> zone 9
            make_point(0.85, 0.15, 3, 0, 2),   // row 8, col 8: water, zone 9
            make_point(5.0, 5.0, 4, 1, 0)      // outside every layer
        };
    }

    ExtractionInputs inputs() const {
        ExtractionInputs in;
        in.elevation_path = elevation_path_;
        in.landcover_path = landcover_path_;
        in.zone_path = zone_path_;
        in.zone_id_field = "zone_type_id";
        return in;
    }

    TempDir dir_;
    std::string elevation_path_;
    std::string landcover_path_;
    std::string zone_path_;
    ReceiverBatch batch_;
};

} // anonymous namespace

TEST_F(ExtractionOrchestratorTest, EnrichesEveryPointInInputOrder) {
    const ExtractionOrchestrator orchestrator;
    const ExtractionResult result = orchestrator.extract(batch_, inputs(), default_worldcover_mapping());

    EXPECT_TRUE(result.degraded.empty());
    ASSERT_EQ(result.records.size(), batch_.size());
    for (size_t i = 0; i < batch_.size(); ++i) {
        EXPECT_EQ(result.records[i].point.rx_id, batch_.points[i].rx_id);
    }

    EXPECT_DOUBLE_EQ(result.records[0].elevation, 0.0);
    EXPECT_EQ(result.records[0].land_cover_code, 10);
    EXPECT_EQ(result.records[0].category, 4);
    EXPECT_DOUBLE_EQ(result.records[0].resistance, 15.0);
    EXPECT_EQ(result.records[0].zone_id, 7);

    EXPECT_DOUBLE_EQ(result.records[1].elevation, 74.0);
    EXPECT_EQ(result.records[1].zone_id, 9);

    EXPECT_DOUBLE_EQ(result.records[2].elevation, 88.0);
    EXPECT_EQ(result.records[2].land_cover_code, 80);
    EXPECT_EQ(result.records[2].category, 2);
    EXPECT_DOUBLE_EQ(result.records[2].resistance, 0.0);
    EXPECT_EQ(result.records[2].zone_id, 9);
}

TEST_F(ExtractionOrchestratorTest, PointOutsideEveryLayerGetsSentinels) {
    const ExtractionOrchestrator orchestrator;
    const ExtractionResult result = orchestrator.extract(batch_, inputs(), default_worldcover_mapping());

    const EnrichedPoint& outside = result.records[3];
    EXPECT_DOUBLE_EQ(outside.elevation, -9999.0);
    EXPECT_EQ(outside.land_cover_code, 255);
    EXPECT_EQ(outside.category, 2);
    EXPECT_DOUBLE_EQ(outside.resistance, 0.0);
    EXPECT_EQ(outside.zone_id, 0);
}

TEST_F(ExtractionOrchestratorTest, MissingZoneLayerOnlyDegradesZones) {
    ExtractionInputs in = inputs();
    in.zone_path = dir_.file("missing.gpkg");

    const ExtractionOrchestrator orchestrator;
    const ExtractionResult result = orchestrator.extract(batch_, in, default_worldcover_mapping());

    ASSERT_EQ(result.degraded.size(), 1u);
    EXPECT_EQ(result.degraded[0].pipeline, Pipeline::ZONE);
    EXPECT_EQ(result.degraded[0].error_kind, "ZoneLayerUnavailable");
    EXPECT_TRUE(result.is_degraded(Pipeline::ZONE));
    EXPECT_FALSE(result.is_degraded(Pipeline::ELEVATION));

    ASSERT_EQ(result.records.size(), batch_.size());
    for (const auto& record : result.records) {
        EXPECT_EQ(record.zone_id, 0);
    }
    EXPECT_DOUBLE_EQ(result.records[1].elevation, 74.0);
    EXPECT_EQ(result.records[0].category, 4);
}

TEST_F(ExtractionOrchestratorTest, MissingRastersDegradeToSentinels) {
    ExtractionInputs in = inputs();
    in.elevation_path = dir_.file("missing.tif");
    in.landcover_path.clear();

    const ExtractionOrchestrator orchestrator;
    const ExtractionResult result = orchestrator.extract(batch_, in, default_worldcover_mapping());

    EXPECT_TRUE(result.is_degraded(Pipeline::ELEVATION));
    EXPECT_TRUE(result.is_degraded(Pipeline::LAND_COVER));
    EXPECT_FALSE(result.is_degraded(Pipeline::ZONE));

    for (const auto& record : result.records) {
        EXPECT_DOUBLE_EQ(record.elevation, -9999.0);
        EXPECT_EQ(record.land_cover_code, 255);
        EXPECT_EQ(record.category, 2);
    }
    EXPECT_EQ(result.records[0].zone_id, 7);
}

TEST_F(ExtractionOrchestratorTest, SequentialAndParallelRunsAgree) {
    ExtractionOptions sequential_options;
    sequential_options.parallel = false;
    ExtractionOptions parallel_options;
    parallel_options.parallel = true;

    const ExtractionResult sequential =
        ExtractionOrchestrator(sequential_options).extract(batch_, inputs(), default_worldcover_mapping());
    const ExtractionResult parallel =
        ExtractionOrchestrator(parallel_options).extract(batch_, inputs(), default_worldcover_mapping());

    ASSERT_EQ(sequential.records.size(), parallel.records.size());
    for (size_t i = 0; i < sequential.records.size(); ++i) {
        EXPECT_DOUBLE_EQ(sequential.records[i].elevation, parallel.records[i].elevation);
        EXPECT_EQ(sequential.records[i].land_cover_code, parallel.records[i].land_cover_code);
        EXPECT_EQ(sequential.records[i].category, parallel.records[i].category);
        EXPECT_DOUBLE_EQ(sequential.records[i].resistance, parallel.records[i].resistance);
        EXPECT_EQ(sequential.records[i].zone_id, parallel.records[i].zone_id);
    }
}

TEST_F(ExtractionOrchestratorTest, BothZoneStrategiesAgree) {
    ExtractionOptions batch_options;
    batch_options.zone_strategy = ZoneJoinStrategy::BATCH_JOIN;
    ExtractionOptions indexed_options;
    indexed_options.zone_strategy = ZoneJoinStrategy::INDEXED_LOOKUP;

    const ExtractionResult by_join =
        ExtractionOrchestrator(batch_options).extract(batch_, inputs(), default_worldcover_mapping());
    const ExtractionResult by_index =
        ExtractionOrchestrator(indexed_options).extract(batch_, inputs(), default_worldcover_mapping());

    for (size_t i = 0; i < batch_.size(); ++i) {
        EXPECT_EQ(by_join.records[i].zone_id, by_index.records[i].zone_id) << "point " << i;
    }
    EXPECT_EQ(by_index.metrics.zone_strategy, "indexed_lookup");
}

TEST_F(ExtractionOrchestratorTest, PointsAreReprojectedIntoTheRasterCrs) {
    // 10 km Web Mercator pixels over x, y in [0, 100 km]
    const GeoTransform mercator{0.0, 10000.0, 0.0, 100000.0, 0.0, -10000.0};
    ExtractionInputs in = inputs();
    in.elevation_path = write_geotiff(dir_.file("dem_3857.tif"), 10, 10, mercator,
                                      indexed_values(10, 10), 3857);

    ReceiverBatch batch;
    batch.points = {make_point(0.45, 0.45, 1)};  // ~50.1 km east, ~50.1 km north

    const ExtractionResult result = ExtractionOrchestrator().extract(batch, in, default_worldcover_mapping());

    EXPECT_FALSE(result.is_degraded(Pipeline::ELEVATION));
    EXPECT_DOUBLE_EQ(result.records[0].elevation, 45.0);
}

TEST_F(ExtractionOrchestratorTest, ZoneLayerIsReprojectedIntoTheBatchCrs) {
    // Web Mercator boxes around the degree-space fixture zones
    ExtractionInputs in = inputs();
    in.zone_path = write_zone_layer(dir_.file("zones_3857.shp"),
                                    {box_zone(9, 40000.0, -10000.0, 120000.0, 55000.0),
                                     box_zone(7, -10000.0, -10000.0, 56000.0, 120000.0)},
                                    3857);
    in.zone_id_field = "zone_id";

    for (ZoneJoinStrategy strategy : {ZoneJoinStrategy::BATCH_JOIN, ZoneJoinStrategy::INDEXED_LOOKUP}) {
        ExtractionOptions options;
        options.zone_strategy = strategy;
        const ExtractionResult result =
            ExtractionOrchestrator(options).extract(batch_, in, default_worldcover_mapping());

        SCOPED_TRACE(to_string(strategy));
        EXPECT_FALSE(result.is_degraded(Pipeline::ZONE));
        ASSERT_EQ(result.records.size(), 4u);
        EXPECT_EQ(result.records[0].zone_id, 7);
        EXPECT_EQ(result.records[1].zone_id, 9);
        EXPECT_EQ(result.records[2].zone_id, 9);
        EXPECT_EQ(result.records[3].zone_id, 0);
    }
}

TEST_F(ExtractionOrchestratorTest, ZoneLayerWithoutCrsDegradesZones) {
    ExtractionInputs in = inputs();
    in.zone_path = write_zone_layer(dir_.file("zones_nocrs.shp"), {box_zone(7, 0.0, 0.0, 1.0, 1.0)}, 0);
    in.zone_id_field = "zone_id";

    const ExtractionResult result = ExtractionOrchestrator().extract(batch_, in, default_worldcover_mapping());

    ASSERT_EQ(result.degraded.size(), 1u);
    EXPECT_EQ(result.degraded[0].pipeline, Pipeline::ZONE);
    EXPECT_EQ(result.degraded[0].error_kind, "CoordinateReferenceMismatch");
    for (const auto& record : result.records) {
        EXPECT_EQ(record.zone_id, 0);
    }
    EXPECT_EQ(result.records[0].category, 4);
}

TEST_F(ExtractionOrchestratorTest, CustomSentinelsAndMappings) {
    ExtractionOptions options;
    options.elevation_sentinel = -1.0;
    options.landcover_sentinel = 0.0;

    CodeMappingTable table;
    table.class_to_category = {{0, 4}, {10, 5}};
    table.default_category = 2;
    table.category_to_resistance = {{4, 90.0}, {5, 75.0}, {2, 15.0}};

    const ExtractionResult result = ExtractionOrchestrator(options).extract(batch_, inputs(), table);

    EXPECT_EQ(result.records[0].category, 5);
    EXPECT_DOUBLE_EQ(result.records[0].resistance, 75.0);
    EXPECT_EQ(result.records[2].category, 2);
    EXPECT_DOUBLE_EQ(result.records[2].resistance, 15.0);
    EXPECT_DOUBLE_EQ(result.records[3].elevation, -1.0);
    EXPECT_EQ(result.records[3].land_cover_code, 0);
    EXPECT_EQ(result.records[3].category, 4);
    EXPECT_DOUBLE_EQ(result.records[3].resistance, 90.0);
}

TEST_F(ExtractionOrchestratorTest, OutOfRangeLandCoverSamplesUseTheSentinelCode) {
    ExtractionInputs in = inputs();
    in.landcover_path = write_geotiff(dir_.file("landcover_f64.tif"), 10, 10, unit_degree_transform(),
                                      std::vector<double>(100, 1e12), 4326, std::nullopt, GDT_Float64);

    const ExtractionResult result = ExtractionOrchestrator().extract(batch_, in, default_worldcover_mapping());

    EXPECT_FALSE(result.is_degraded(Pipeline::LAND_COVER));
    for (const auto& record : result.records) {
        EXPECT_EQ(record.land_cover_code, 255);
        EXPECT_EQ(record.category, 2);
        EXPECT_DOUBLE_EQ(record.resistance, 0.0);
    }
}

TEST_F(ExtractionOrchestratorTest, EmptyBatch) {
    const ExtractionResult result =
        ExtractionOrchestrator().extract(ReceiverBatch{}, inputs(), default_worldcover_mapping());
    EXPECT_TRUE(result.records.empty());
    EXPECT_TRUE(result.degraded.empty());
}

TEST_F(ExtractionOrchestratorTest, StatisticsSummarizeRecords) {
    const ExtractionResult result = ExtractionOrchestrator().extract(batch_, inputs(), default_worldcover_mapping());
    const ExtractionStatistics stats = compute_statistics(result, -9999.0);

    EXPECT_EQ(stats.total_points, 4u);
    EXPECT_EQ(stats.unresolved_elevations, 1u);
    ASSERT_TRUE(stats.min_elevation.has_value());
    EXPECT_DOUBLE_EQ(*stats.min_elevation, 0.0);
    EXPECT_DOUBLE_EQ(*stats.max_elevation, 88.0);
    EXPECT_EQ(stats.zone_distribution.at(9), 2u);
    EXPECT_EQ(stats.zone_distribution.at(0), 1u);
}

TEST(CrsReconcilerTest, RejectsUndefinedCrs) {
    EXPECT_THROW(CrsReconciler(""), CoordinateReferenceMismatch);
    EXPECT_THROW(CrsReconciler("not a crs"), CoordinateReferenceMismatch);

    const CrsReconciler reconciler("EPSG:4326");
    EXPECT_TRUE(reconciler.matches("EPSG:4326", "test layer"));
    EXPECT_FALSE(reconciler.matches("EPSG:3857", "test layer"));
    EXPECT_THROW(reconciler.matches("", "test layer"), CoordinateReferenceMismatch);
}
