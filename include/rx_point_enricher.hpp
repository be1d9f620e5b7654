#pragma once

/**
 * @file rx_point_enricher.hpp
 * @brief Main header for the receiver point enrichment engine
 *
 * Enriches batches of radio receiver points with ground elevation,
 * land-cover category/resistance and regulatory zone id using
 * GDAL rasters and OGR polygon layers loaded once per run.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace rxgis {

// ============================================================================
// Point Types
// ============================================================================

/**
 * @brief Correlates a point with its slot in the generated receiver grid
 */
struct PointId {
    int azimuth_index = 0;
    int distance_index = 0;

    PointId() = default;
    PointId(int azimuth, int distance) : azimuth_index(azimuth), distance_index(distance) {}

    bool operator==(const PointId& other) const {
        return azimuth_index == other.azimuth_index && distance_index == other.distance_index;
    }
};

/**
 * @brief Immutable receiver location produced by the point generator or reader
 */
struct ReceiverPoint {
    double lon = 0.0;
    double lat = 0.0;
    PointId id;
    std::string tx_id;
    int rx_id = 0;
    double distance_km = 0.0;
    double azimuth_deg = 0.0;

    ReceiverPoint() = default;
    ReceiverPoint(double longitude, double latitude, const PointId& point_id)
        : lon(longitude), lat(latitude), id(point_id) {}
};

/**
 * @brief Ordered collection of receiver points sharing one declared CRS
 */
struct ReceiverBatch {
    std::vector<ReceiverPoint> points;
    std::string crs = "EPSG:4326";  // Any definition accepted by OGRSpatialReference::SetFromUserInput

    size_t size() const { return points.size(); }
    bool empty() const { return points.empty(); }
};

/**
 * @brief Structure-of-arrays coordinates used for batched transforms
 */
struct CoordinateBatch {
    std::vector<double> x;
    std::vector<double> y;

    size_t size() const { return x.size(); }

    static CoordinateBatch from_points(const ReceiverBatch& batch) {
        CoordinateBatch coords;
        coords.x.reserve(batch.size());
        coords.y.reserve(batch.size());
        for (const auto& point : batch.points) {
            coords.x.push_back(point.lon);
            coords.y.push_back(point.lat);
        }
        return coords;
    }
};

// ============================================================================
// Layer Types
// ============================================================================

/**
 * @brief GDAL-ordered affine coefficients (origin_x, px_w, rot, origin_y, rot, px_h)
 */
using GeoTransform = std::array<double, 6>;

/**
 * @brief Fully materialized single-band raster
 *
 * Values are stored row-major as doubles. The grid is read-only once the
 * preloader returns it and can be shared between pipelines without locking.
 */
struct RasterGrid {
    std::string source_path;
    std::vector<double> values;
    size_t width = 0;
    size_t height = 0;
    GeoTransform geotransform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    GeoTransform inverse_geotransform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    std::optional<double> nodata;
    std::string crs_wkt;

    double at(size_t row, size_t col) const { return values[row * width + col]; }
    size_t footprint_bytes() const { return values.size() * sizeof(double); }
};

// ============================================================================
// Code Mapping
// ============================================================================

/**
 * @brief Two-stage land-cover mapping: raw class -> category -> resistance
 */
struct CodeMappingTable {
    std::map<int, int> class_to_category;
    int default_category = 2;
    std::map<int, double> category_to_resistance;
    double default_resistance = 0.0;
};

// ============================================================================
// Output Types
// ============================================================================

/**
 * @brief Receiver point with every extracted attribute
 */
struct EnrichedPoint {
    ReceiverPoint point;
    double elevation = 0.0;       // h
    int land_cover_code = 0;      // ct (raw class, sentinel when unresolved)
    int category = 0;             // Ct
    double resistance = 0.0;      // R
    int zone_id = 0;              // 0 = no containing zone
};

/**
 * @brief Lookup pipelines run by the extraction orchestrator
 */
enum class Pipeline {
    ELEVATION,
    LAND_COVER,
    ZONE,
    CODE_MAPPING
};

std::string to_string(Pipeline pipeline);

/**
 * @brief Record of a pipeline whose output fell back to defaults
 */
struct PipelineDegradation {
    Pipeline pipeline;
    std::string error_kind;  // "RasterUnavailable", "ZoneLayerUnavailable", ...
    std::string message;
};

/**
 * @brief Timing for one extraction call
 */
struct ExtractionMetrics {
    std::chrono::milliseconds elevation_time{0};
    std::chrono::milliseconds land_cover_time{0};
    std::chrono::milliseconds zone_time{0};
    std::chrono::milliseconds total_time{0};
    std::string zone_strategy;  // Strategy actually used for zone lookup
};

/**
 * @brief Result of one extraction call
 */
struct ExtractionResult {
    std::vector<EnrichedPoint> records;
    std::vector<PipelineDegradation> degraded;
    ExtractionMetrics metrics;

    bool is_degraded(Pipeline pipeline) const {
        for (const auto& entry : degraded) {
            if (entry.pipeline == pipeline) return true;
        }
        return false;
    }
};

/**
 * @brief Summary statistics over enriched records
 */
struct ExtractionStatistics {
    size_t total_points = 0;
    std::optional<double> min_elevation;
    std::optional<double> max_elevation;
    size_t unresolved_elevations = 0;
    size_t distinct_land_cover_codes = 0;
    std::vector<int> categories;
    std::map<int, size_t> zone_distribution;
    std::vector<double> resistance_values;
};

// ============================================================================
// Run Configuration
// ============================================================================

/**
 * @brief Configuration for a complete enrichment run
 */
struct EnrichmentConfig {
    // Transmitter (TRANSMITTER section)
    std::string tx_id = "TX_0001";
    double tx_longitude = -13.40694;
    double tx_latitude = 9.345;
    double antenna_height_tx = 57.0;  // meters
    double antenna_height_rx = 10.0;  // meters

    // P.1812 parameters carried through to profile export
    double frequency_ghz = 0.9;
    double time_percentage = 50.0;
    int polarization = 1;  // 1=horizontal, 2=vertical

    // Receiver generation: "radial" profile grid or "phyllotaxis" spiral
    std::string receiver_layout = "radial";
    double max_distance_km = 11.0;
    double azimuth_step_deg = 10.0;
    double distance_step_km = 0.03;
    double sampling_resolution_m = 30.0;
    bool include_tx_point = true;
    int num_points = 500;             // phyllotaxis only
    double layout_scale_m = 1000.0;   // phyllotaxis outer radius

    // Data sources
    std::string elevation_raster;
    std::string landcover_raster;
    std::string zone_layer;
    std::string zone_id_field = "zone_type_id";
    std::vector<int> expected_zone_ids = {1, 3, 4};  // Sea, coastal, inland; empty disables the check
    std::optional<std::string> points_file;

    // Extraction policy
    double elevation_sentinel = -9999.0;
    double landcover_sentinel = 255.0;
    bool parallel_processing = true;
    CodeMappingTable mappings;

    // Output
    std::string output_directory = "output";
    std::string base_name = "receivers";
    std::vector<std::string> output_formats = {"csv"};

    // Logging
    int log_level = 3;
    std::string log_config;
    std::optional<std::string> log_file;
    std::optional<std::string> config_file;
};

} // namespace rxgis
