/**
 * @file GeoJSONExporter.hpp
 * @brief GeoJSON export for enriched receiver points
 *
 * Exports enriched receivers as a GeoJSON FeatureCollection of Point
 * features for use in web mapping applications and GIS software.
 */

#pragma once

#include "rx_point_enricher.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief Exports enriched points as GeoJSON
 *
 * Each feature carries the receiver identifiers and every extracted
 * attribute (h, ct, Ct, R, zone) as properties.
 */
class GeoJSONExporter {
public:
    struct Options {
        bool pretty_print;
        std::string crs;
        bool include_crs;

        Options()
            : pretty_print(true),
              crs("EPSG:4326"),
              include_crs(true) {}
    };

    GeoJSONExporter();
    explicit GeoJSONExporter(const Options& options);

    /**
     * @brief Export records as a GeoJSON FeatureCollection
     * @param records Enriched points to export
     * @param filename Output GeoJSON filename
     * @return true if export succeeded
     */
    bool export_geojson(const std::vector<EnrichedPoint>& records,
                        const std::string& filename) const;

    /**
     * @brief Build the FeatureCollection without writing it
     */
    nlohmann::json to_feature_collection(const std::vector<EnrichedPoint>& records) const;

private:
    Options options_;

    nlohmann::json point_to_feature(const EnrichedPoint& record) const;
};

} // namespace rxgis
