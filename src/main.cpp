/**
 * @file main.cpp
 * @brief Main entry point for rx-enrich
 *
 * Generates or reads receiver points, enriches them with elevation,
 * land-cover resistance and zone id, and writes the configured outputs.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "rx_point_enricher.hpp"
#include "cli/CommandLineInterface.hpp"
#include "cli/ExportOrchestrator.hpp"
#include "core/ExtractionOrchestrator.hpp"
#include "core/Logger.hpp"
#include "core/PointReader.hpp"
#include "core/ReceiverPointGenerator.hpp"
#include <chrono>
#include <iostream>

using namespace rxgis;

namespace {

ReceiverBatch build_receivers(const EnrichmentConfig& config) {
    if (config.points_file) {
        PointReader reader;
        return reader.read(*config.points_file);
    }

    ReceiverPointGenerator generator;
    return generator.generate(config);
}

void print_extraction_summary(const ExtractionResult& result) {
    const auto& metrics = result.metrics;
    std::cout << "\n=== Extraction Summary ===\n";
    std::cout << "Receivers: " << result.records.size() << "\n";
    std::cout << "Elevation: " << metrics.elevation_time.count() << "ms\n";
    std::cout << "Land cover: " << metrics.land_cover_time.count() << "ms\n";
    std::cout << "Zones: " << metrics.zone_time.count() << "ms";
    if (!metrics.zone_strategy.empty()) {
        std::cout << " (" << metrics.zone_strategy << ")";
    }
    std::cout << "\n";
    std::cout << "Total time: " << metrics.total_time.count() << "ms\n";

    for (const auto& entry : result.degraded) {
        std::cout << "Degraded " << to_string(entry.pipeline) << ": " << entry.error_kind
                  << " - " << entry.message << "\n";
    }
    std::cout << "==========================\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto start_time = std::chrono::high_resolution_clock::now();

    CommandLineInterface cli;
    if (!cli.parse_arguments(argc, argv)) {
        return cli.exit_code();
    }

    const EnrichmentConfig& config = cli.get_config();
    if (!Logger::setDefaultLogFile(config.log_file)) {
        return 1;
    }
    Logger logger("Main");

    try {
        if (config.log_level >= 4) {
            cli.print_config();
        }

        if (cli.is_dry_run()) {
            logger.info("Dry run mode - configuration validated successfully");
            return 0;
        }

        ReceiverBatch batch = build_receivers(config);
        logger.info("Enriching " + std::to_string(batch.size()) + " receiver points");

        ExtractionOrchestrator orchestrator(ExtractionOptions::from_config(config));
        ExtractionResult result = orchestrator.extract(batch, ExtractionInputs::from_config(config),
                                                       config.mappings);

        ExportOrchestrator exporter(config);
        if (!exporter.export_all_formats(result.records)) {
            logger.error("Export failed");
            return 1;
        }

        if (config.log_level >= 3) {
            print_extraction_summary(result);
        }

        auto total_duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::high_resolution_clock::now() - start_time);
        logger.info("Enrichment completed in " + std::to_string(total_duration.count()) + "ms");
        Logger::setDefaultLogFile(std::nullopt);
        return 0;

    } catch (const std::exception& e) {
        logger.error(std::string("Fatal error: ") + e.what());
        return 1;
    }
}
