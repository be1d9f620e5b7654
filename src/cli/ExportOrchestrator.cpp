/**
 * @file ExportOrchestrator.cpp
 * @brief Implementation of export orchestration
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#include "ExportOrchestrator.hpp"
#include "../export/CSVExporter.hpp"
#include "../export/GeoJSONExporter.hpp"
#include "../export/ProfileExporter.hpp"
#include <chrono>
#include <filesystem>

namespace rxgis {

ExportOrchestrator::ExportOrchestrator(const EnrichmentConfig& config)
    : config_(config)
    , logger_("ExportOrchestrator")
{
}

std::string ExportOrchestrator::output_path(const std::string& format) const {
    const std::string base = (std::filesystem::path(config_.output_directory) / config_.base_name).string();

    if (format == "csv") {
        return base + ".csv";
    }
    if (format == "geojson") {
        return base + ".geojson";
    }
    if (format == "profiles") {
        return base + "_profiles.csv";
    }
    return "";
}

bool ExportOrchestrator::export_all_formats(const std::vector<EnrichedPoint>& records) {
    auto start_time = std::chrono::high_resolution_clock::now();
    written_files_.clear();

    std::error_code ec;
    std::filesystem::create_directories(config_.output_directory, ec);
    if (ec) {
        logger_.error("Cannot create output directory " + config_.output_directory + ": " + ec.message());
        return false;
    }

    bool success = true;
    for (const auto& format : config_.output_formats) {
        if (!export_format(format, records)) {
            success = false;
        }
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    auto export_duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
    logger_.info("Export completed in " + std::to_string(export_duration.count()) + "ms (" +
                 std::to_string(written_files_.size()) + " file(s))");

    return success;
}

bool ExportOrchestrator::export_format(const std::string& format, const std::vector<EnrichedPoint>& records) {
    const std::string filename = output_path(format);
    if (filename.empty()) {
        logger_.warning("Skipping unsupported output format '" + format + "'");
        return false;
    }

    logger_.debug("Exporting " + format + " to " + filename);

    bool exported = false;
    if (format == "csv") {
        CSVExporter exporter;
        exported = exporter.export_csv(records, filename);
    } else if (format == "geojson") {
        GeoJSONExporter::Options geojson_opts;
        geojson_opts.pretty_print = true;
        geojson_opts.include_crs = true;
        GeoJSONExporter exporter(geojson_opts);
        exported = exporter.export_geojson(records, filename);
    } else {
        ProfileExporter exporter(ProfileExporter::Parameters::from_config(config_));
        exported = exporter.export_profiles(records, filename);
    }

    if (!exported) {
        logger_.warning(format + " export failed");
        return false;
    }

    logger_.info("Successfully exported " + format + ": " + filename);
    written_files_.push_back(filename);
    return true;
}

} // namespace rxgis
