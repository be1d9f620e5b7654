#pragma once

/**
 * @file ZoneLayer.hpp
 * @brief Zone polygon set and its OGR loader
 */

#include "Logger.hpp"
#include <ogr_geometry.h>
#include <map>
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief One zone polygon, tagged with its integer zone id
 */
struct ZonePolygon {
    int zone_id = 0;
    size_t storage_index = 0;     // Position in the source layer, used for tie-breaks
    OGRGeometryUniquePtr geometry;
    OGREnvelope envelope;
};

/**
 * @brief Ordered zone polygons in one CRS
 *
 * Storage order is the order of the source layer. Polygons are treated as
 * non-overlapping; where they overlap the first one in storage order wins.
 */
struct ZonePolygonSet {
    std::string source_path;
    std::string crs_wkt;
    std::vector<ZonePolygon> polygons;
    size_t skipped_features = 0;  // No polygon geometry or no id value

    size_t size() const { return polygons.size(); }
    bool empty() const { return polygons.empty(); }

    /**
     * @brief Append a polygon, assigning the next storage index
     * @return false if geometry is null or not (multi)polygonal
     */
    bool add(int zone_id, OGRGeometryUniquePtr geometry);
};

/**
 * @brief Reads a polygon layer through OGR
 */
class ZoneLayerLoader {
public:
    ZoneLayerLoader();

    /**
     * @brief Load every polygonal feature of the first layer
     * @param path Any OGR-readable vector source
     * @param id_field Integer attribute carrying the zone id; features where
     *        it is unset or null are skipped
     * @throws ZoneLayerUnavailable if the source cannot be opened, has no
     *         layer, or lacks the id field
     */
    ZonePolygonSet load(const std::string& path, const std::string& id_field) const;

private:
    Logger logger_;
};

/**
 * @brief Zone ids present in a loaded layer
 */
struct ZoneLayerReport {
    std::map<int, size_t> polygons_per_zone;
    std::vector<int> missing_zone_ids;  // Expected but absent, in expected order

    bool complete() const { return missing_zone_ids.empty(); }
};

/**
 * @brief Check a loaded layer against the zone ids a run expects
 *
 * Logs the polygon count per zone id at DETAILED and a WARNING naming every
 * expected id with no polygon. An empty expected list only reports the
 * distribution.
 */
ZoneLayerReport validate_zone_layer(const ZonePolygonSet& zones, const std::vector<int>& expected_zone_ids,
                                    const Logger& logger);

} // namespace rxgis
