/**
 * @file ExportOrchestrator.hpp
 * @brief Writes enriched receiver records to the configured output formats
 *
 * Keeps format selection and file naming out of the extraction core so
 * RxCore has no dependency on RxExport.
 *
 * Copyright (c) 2025 Matthew Block
 * Licensed under the MIT License.
 */

#pragma once

#include "rx_point_enricher.hpp"
#include "../core/Logger.hpp"
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief Dispatches enriched records to the CSV, GeoJSON and profile exporters
 *
 * Files are named <output_directory>/<base_name>.csv, <base_name>.geojson
 * and <base_name>_profiles.csv.
 */
class ExportOrchestrator {
public:
    explicit ExportOrchestrator(const EnrichmentConfig& config);

    /**
     * @brief Export records to all configured output formats
     * @return true if every requested format was written
     */
    bool export_all_formats(const std::vector<EnrichedPoint>& records);

    /**
     * @brief Files written by the last export_all_formats() call
     */
    const std::vector<std::string>& written_files() const { return written_files_; }

    /**
     * @brief Output path for a format, or an empty string for an unknown format
     */
    std::string output_path(const std::string& format) const;

private:
    const EnrichmentConfig& config_;
    Logger logger_;
    std::vector<std::string> written_files_;

    bool export_format(const std::string& format, const std::vector<EnrichedPoint>& records);

    ExportOrchestrator(const ExportOrchestrator&) = delete;
    ExportOrchestrator& operator=(const ExportOrchestrator&) = delete;
};

} // namespace rxgis
