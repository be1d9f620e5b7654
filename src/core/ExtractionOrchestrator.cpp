/**
 * @file ExtractionOrchestrator.cpp
 * @brief Pipeline sequencing, CRS reconciliation and result merging
 */

#include "ExtractionOrchestrator.hpp"
#include "CodeMapping.hpp"
#include "CrsReconciler.hpp"
#include "ExecutionPolicies.hpp"
#include "ExtractionErrors.hpp"
#include "PixelIndexer.hpp"
#include "RasterPreloader.hpp"
#include "RasterSampler.hpp"
#include "ZoneLayer.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace rxgis {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

std::string error_kind(const std::exception& error) {
    if (dynamic_cast<const RasterUnavailable*>(&error)) return "RasterUnavailable";
    if (dynamic_cast<const ZoneLayerUnavailable*>(&error)) return "ZoneLayerUnavailable";
    if (dynamic_cast<const CoordinateReferenceMismatch*>(&error)) return "CoordinateReferenceMismatch";
    if (dynamic_cast<const std::bad_alloc*>(&error)) return "OutOfMemory";
    return "RuntimeError";
}

} // anonymous namespace

std::string to_string(Pipeline pipeline) {
    switch (pipeline) {
        case Pipeline::ELEVATION: return "elevation";
        case Pipeline::LAND_COVER: return "land_cover";
        case Pipeline::ZONE: return "zone";
        case Pipeline::CODE_MAPPING: return "code_mapping";
    }
    return "unknown";
}

ExtractionInputs ExtractionInputs::from_config(const EnrichmentConfig& config) {
    ExtractionInputs inputs;
    inputs.elevation_path = config.elevation_raster;
    inputs.landcover_path = config.landcover_raster;
    inputs.zone_path = config.zone_layer;
    inputs.zone_id_field = config.zone_id_field;
    inputs.expected_zone_ids = config.expected_zone_ids;
    return inputs;
}

ExtractionOptions ExtractionOptions::from_config(const EnrichmentConfig& config) {
    ExtractionOptions options;
    options.elevation_sentinel = config.elevation_sentinel;
    options.landcover_sentinel = config.landcover_sentinel;
    options.parallel = config.parallel_processing;
    return options;
}

ExtractionOrchestrator::ExtractionOrchestrator(const ExtractionOptions& options)
    : options_(options), logger_("ExtractionOrchestrator") {
}

PipelineDegradation ExtractionOrchestrator::degrade(Pipeline pipeline, const std::exception& error) const {
    PipelineDegradation degradation{pipeline, error_kind(error), error.what()};
    logger_.warning("Pipeline " + to_string(pipeline) + " degraded to defaults: " + degradation.message);
    return degradation;
}

ExtractionOrchestrator::PipelineOutput ExtractionOrchestrator::run_raster_pipeline(
    Pipeline pipeline, const ReceiverBatch& batch, const std::string& path, double sentinel) const {

    PipelineOutput output;
    const auto start = Clock::now();

    try {
        if (path.empty()) {
            throw RasterUnavailable("no " + to_string(pipeline) + " raster configured");
        }

        RasterPreloader preloader;
        const RasterGrid grid = preloader.load(path);

        // Points move into the raster CRS; the raster is never resampled
        const CrsReconciler reconciler(batch.crs);
        const CoordinateBatch coords =
            reconciler.to_layer(CoordinateBatch::from_points(batch), grid.crs_wkt, to_string(pipeline) + " raster");

        const PixelIndices indices = to_pixels(coords, grid);
        output.values = sample(grid, indices, sentinel);

        const size_t inside = indices.count_in_bounds();
        output.detail = std::to_string(inside) + "/" + std::to_string(batch.size()) + " inside raster";
        if (inside < batch.size()) {
            logger_.detailed(std::to_string(batch.size() - inside) + " points fall outside the " +
                             to_string(pipeline) + " raster");
        }
    } catch (const std::exception& e) {
        output.values.assign(batch.size(), sentinel);
        output.degradation = degrade(pipeline, e);
    }

    output.elapsed = elapsed_since(start);
    return output;
}

ExtractionOrchestrator::PipelineOutput ExtractionOrchestrator::run_zone_pipeline(
    const ReceiverBatch& batch, const ExtractionInputs& inputs) const {

    PipelineOutput output;
    const auto start = Clock::now();

    try {
        ZoneLayerLoader loader;
        ZonePolygonSet zones = loader.load(inputs.zone_path, inputs.zone_id_field);
        validate_zone_layer(zones, inputs.expected_zone_ids, logger_);

        // Polygons move into the batch CRS once
        const CrsReconciler reconciler(batch.crs);
        reconciler.to_working(zones);

        const ZoneResolver resolver(options_.zone_strategy);
        const ZoneResolution resolution = resolver.resolve(CoordinateBatch::from_points(batch), zones);

        output.values.assign(resolution.zone_ids.begin(), resolution.zone_ids.end());
        output.detail = to_string(resolution.strategy);
        if (resolution.fell_back) {
            output.detail += " (fallback)";
        }
    } catch (const std::exception& e) {
        output.values.assign(batch.size(), 0.0);
        output.degradation = degrade(Pipeline::ZONE, e);
        output.detail = "none";
    }

    output.elapsed = elapsed_since(start);
    return output;
}

ExtractionResult ExtractionOrchestrator::extract(const ReceiverBatch& batch,
                                                 const ExtractionInputs& inputs,
                                                 const CodeMappingTable& mappings) const {
    const auto start = Clock::now();
    ExtractionResult result;

    logger_.info("Extracting attributes for " + std::to_string(batch.size()) + " points");
    if (batch.empty()) {
        return result;
    }

    PipelineOutput elevation;
    PipelineOutput land_cover;
    PipelineOutput zones;

    std::vector<PipelineTask> tasks = {
        [&] { elevation = run_raster_pipeline(Pipeline::ELEVATION, batch, inputs.elevation_path,
                                              options_.elevation_sentinel); },
        [&] { land_cover = run_raster_pipeline(Pipeline::LAND_COVER, batch, inputs.landcover_path,
                                               options_.landcover_sentinel); },
        [&] { zones = run_zone_pipeline(batch, inputs); }
    };

    if (options_.parallel && parallel_execution_available()) {
        logger_.detailed("Running pipelines in parallel");
        run_tasks(ParallelPolicy{}, tasks);
    } else {
        logger_.detailed("Running pipelines sequentially");
        run_tasks(SequentialPolicy{}, tasks);
    }

    // Code mapping on the land-cover samples
    std::vector<int> categories;
    std::vector<double> resistances;
    try {
        categories = map_categories(land_cover.values, mappings);
        resistances = map_resistances(categories, mappings);
    } catch (const std::exception& e) {
        categories.assign(batch.size(), mappings.default_category);
        resistances.assign(batch.size(), mappings.default_resistance);
        result.degraded.push_back(degrade(Pipeline::CODE_MAPPING, e));
    }

    for (const auto* output : {&elevation, &land_cover, &zones}) {
        if (output->degradation) {
            result.degraded.push_back(*output->degradation);
        }
    }

    // Merge, one record per input point in input order
    const int sentinel_code = to_class_code(options_.landcover_sentinel).value_or(0);
    result.records.reserve(batch.size());
    for (size_t i = 0; i < batch.size(); ++i) {
        EnrichedPoint record;
        record.point = batch.points[i];
        record.elevation = elevation.values[i];
        record.land_cover_code = to_class_code(land_cover.values[i]).value_or(sentinel_code);
        record.category = categories[i];
        record.resistance = resistances[i];
        record.zone_id = static_cast<int>(zones.values[i]);
        result.records.push_back(std::move(record));

        if (logger_.shouldOutput(LogLevel::TRACE)) {
            const auto& r = result.records.back();
            logger_.trace("rx " + std::to_string(r.point.rx_id) + ": h=" + std::to_string(r.elevation) +
                          " ct=" + std::to_string(r.land_cover_code) + " Ct=" + std::to_string(r.category) +
                          " R=" + std::to_string(r.resistance) + " zone=" + std::to_string(r.zone_id));
        }
    }

    result.metrics.elevation_time = elevation.elapsed;
    result.metrics.land_cover_time = land_cover.elapsed;
    result.metrics.zone_time = zones.elapsed;
    result.metrics.zone_strategy = zones.detail;
    result.metrics.total_time = elapsed_since(start);

    logger_.info("Extraction finished in " + std::to_string(result.metrics.total_time.count()) + " ms (elevation " +
                 std::to_string(elevation.elapsed.count()) + " ms, land cover " +
                 std::to_string(land_cover.elapsed.count()) + " ms, zones " +
                 std::to_string(zones.elapsed.count()) + " ms via " + zones.detail + ")");
    if (!result.degraded.empty()) {
        logger_.warning(std::to_string(result.degraded.size()) + " pipeline(s) degraded");
    }

    log_statistics(logger_, compute_statistics(result, options_.elevation_sentinel));
    return result;
}

ExtractionStatistics compute_statistics(const ExtractionResult& result, double elevation_sentinel) {
    ExtractionStatistics stats;
    stats.total_points = result.records.size();

    std::set<int> land_cover_codes;
    std::set<int> categories;
    std::set<double> resistances;

    for (const auto& record : result.records) {
        if (record.elevation == elevation_sentinel || !std::isfinite(record.elevation)) {
            stats.unresolved_elevations++;
        } else {
            stats.min_elevation = stats.min_elevation ? std::min(*stats.min_elevation, record.elevation)
                                                      : record.elevation;
            stats.max_elevation = stats.max_elevation ? std::max(*stats.max_elevation, record.elevation)
                                                      : record.elevation;
        }

        land_cover_codes.insert(record.land_cover_code);
        categories.insert(record.category);
        resistances.insert(record.resistance);
        stats.zone_distribution[record.zone_id]++;
    }

    stats.distinct_land_cover_codes = land_cover_codes.size();
    stats.categories.assign(categories.begin(), categories.end());
    stats.resistance_values.assign(resistances.begin(), resistances.end());
    return stats;
}

void log_statistics(const Logger& logger, const ExtractionStatistics& stats) {
    std::ostringstream summary;
    summary << std::fixed << std::setprecision(1);
    summary << stats.total_points << " points";
    if (stats.min_elevation && stats.max_elevation) {
        summary << ", elevation " << *stats.min_elevation << " to " << *stats.max_elevation << " m";
    }
    summary << ", " << stats.unresolved_elevations << " unresolved elevations, "
            << stats.distinct_land_cover_codes << " land-cover codes";
    logger.info(summary.str());

    std::ostringstream detail;
    detail << "Categories:";
    for (int category : stats.categories) {
        detail << ' ' << category;
    }
    detail << "; resistances:";
    for (double resistance : stats.resistance_values) {
        detail << ' ' << resistance;
    }
    detail << "; zones:";
    for (const auto& [zone, count] : stats.zone_distribution) {
        detail << ' ' << zone << '=' << count;
    }
    logger.detailed(detail.str());
}

} // namespace rxgis
