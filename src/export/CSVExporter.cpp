/**
 * @file CSVExporter.cpp
 * @brief Implementation of enriched point CSV export
 */

#include "CSVExporter.hpp"
#include "../core/Logger.hpp"
#include <fstream>
#include <iomanip>

namespace rxgis {

CSVExporter::CSVExporter()
    : options_() {}

CSVExporter::CSVExporter(const Options& options)
    : options_(options) {}

void CSVExporter::write(std::ostream& out, const std::vector<EnrichedPoint>& records) const {
    if (options_.include_header) {
        out << "tx_id,rx_id,azimuth_index,distance_index,azimuth_deg,distance_km,lon,lat,h,ct,Ct,R,zone\n";
    }

    for (const auto& record : records) {
        const auto& point = record.point;
        out << escape_csv_field(point.tx_id) << ','
            << point.rx_id << ','
            << point.id.azimuth_index << ','
            << point.id.distance_index << ','
            << std::fixed << std::setprecision(options_.value_precision)
            << point.azimuth_deg << ','
            << point.distance_km << ','
            << std::setprecision(options_.coordinate_precision)
            << point.lon << ','
            << point.lat << ','
            << std::setprecision(options_.value_precision)
            << record.elevation << ','
            << record.land_cover_code << ','
            << record.category << ','
            << record.resistance << ','
            << record.zone_id << '\n';
    }
}

std::string CSVExporter::escape_csv_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    // RFC 4180: wrap in quotes, double embedded quotes
    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

bool CSVExporter::export_csv(const std::vector<EnrichedPoint>& records, const std::string& filename) const {
    Logger logger("CSVExporter");

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create CSV file: " + filename);
        return false;
    }

    write(file, records);
    file.close();

    if (file.fail()) {
        logger.error("Failed while writing CSV file: " + filename);
        return false;
    }

    logger.info("Exported " + std::to_string(records.size()) + " points to CSV: " + filename);
    return true;
}

} // namespace rxgis
