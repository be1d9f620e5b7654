#pragma once

/**
 * @file ExtractionOrchestrator.hpp
 * @brief Runs the elevation, land-cover and zone pipelines over one batch
 */

#include "rx_point_enricher.hpp"
#include "ZoneResolver.hpp"
#include "Logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief Layer sources for one extraction call
 */
struct ExtractionInputs {
    std::string elevation_path;
    std::string landcover_path;
    std::string zone_path;
    std::string zone_id_field = "zone_type_id";
    std::vector<int> expected_zone_ids;  // Warned about when absent from the zone layer

    static ExtractionInputs from_config(const EnrichmentConfig& config);
};

struct ExtractionOptions {
    double elevation_sentinel = -9999.0;
    double landcover_sentinel = 255.0;
    bool parallel = true;
    std::optional<ZoneJoinStrategy> zone_strategy;  // Unset: choose by capability probe

    static ExtractionOptions from_config(const EnrichmentConfig& config);
};

/**
 * @brief Point-data extraction engine
 *
 * Each call preloads every layer once, reconciles its CRS against the
 * batch CRS once, and runs the three lookup pipelines as independent tasks.
 * A failing pipeline only degrades its own attributes: the call always
 * returns one record per input point, in input order, together with the
 * list of degraded pipelines.
 */
class ExtractionOrchestrator {
public:
    explicit ExtractionOrchestrator(const ExtractionOptions& options = ExtractionOptions());

    ExtractionResult extract(const ReceiverBatch& batch,
                             const ExtractionInputs& inputs,
                             const CodeMappingTable& mappings) const;

    const ExtractionOptions& options() const { return options_; }

private:
    ExtractionOptions options_;
    Logger logger_;

    struct PipelineOutput {
        std::vector<double> values;
        std::optional<PipelineDegradation> degradation;
        std::chrono::milliseconds elapsed{0};
        std::string detail;
    };

    PipelineOutput run_raster_pipeline(Pipeline pipeline, const ReceiverBatch& batch,
                                       const std::string& path, double sentinel) const;
    PipelineOutput run_zone_pipeline(const ReceiverBatch& batch, const ExtractionInputs& inputs) const;

    PipelineDegradation degrade(Pipeline pipeline, const std::exception& error) const;
};

/**
 * @brief Summary over enriched records
 *
 * Elevations equal to the sentinel count as unresolved and are excluded
 * from the range.
 */
ExtractionStatistics compute_statistics(const ExtractionResult& result, double elevation_sentinel);

/**
 * @brief Log a statistics summary at INFO/DETAILED levels
 */
void log_statistics(const Logger& logger, const ExtractionStatistics& stats);

} // namespace rxgis
