/**
 * @file GeoJSONExporter.cpp
 * @brief Implementation of GeoJSON export
 */

#include "GeoJSONExporter.hpp"
#include "../core/Logger.hpp"
#include <fstream>

namespace rxgis {

GeoJSONExporter::GeoJSONExporter()
    : options_() {}

GeoJSONExporter::GeoJSONExporter(const Options& options)
    : options_(options) {}

bool GeoJSONExporter::export_geojson(const std::vector<EnrichedPoint>& records,
                                     const std::string& filename) const {
    Logger logger("GeoJSONExporter");

    if (records.empty()) {
        logger.warning("No points to export, writing empty FeatureCollection");
    }

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create GeoJSON file: " + filename);
        return false;
    }

    file << to_feature_collection(records).dump(options_.pretty_print ? 2 : -1);
    file.close();

    if (file.fail()) {
        logger.error("Failed while writing GeoJSON file: " + filename);
        return false;
    }

    logger.info("Exported GeoJSON: " + filename);
    return true;
}

nlohmann::json GeoJSONExporter::to_feature_collection(const std::vector<EnrichedPoint>& records) const {
    nlohmann::json collection;
    collection["type"] = "FeatureCollection";

    if (options_.include_crs) {
        collection["crs"] = {
            {"type", "name"},
            {"properties", {{"name", options_.crs}}}
        };
    }

    nlohmann::json features = nlohmann::json::array();
    for (const auto& record : records) {
        features.push_back(point_to_feature(record));
    }
    collection["features"] = std::move(features);

    return collection;
}

nlohmann::json GeoJSONExporter::point_to_feature(const EnrichedPoint& record) const {
    const auto& point = record.point;

    nlohmann::json feature;
    feature["type"] = "Feature";
    feature["geometry"] = {
        {"type", "Point"},
        {"coordinates", {point.lon, point.lat}}
    };
    feature["properties"] = {
        {"tx_id", point.tx_id},
        {"rx_id", point.rx_id},
        {"azimuth_index", point.id.azimuth_index},
        {"distance_index", point.id.distance_index},
        {"azimuth_deg", point.azimuth_deg},
        {"distance_km", point.distance_km},
        {"h", record.elevation},
        {"ct", record.land_cover_code},
        {"Ct", record.category},
        {"R", record.resistance},
        {"zone", record.zone_id}
    };

    return feature;
}

} // namespace rxgis
