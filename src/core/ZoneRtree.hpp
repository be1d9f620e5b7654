#pragma once

/**
 * @file ZoneRtree.hpp
 * @brief GEOS STRtree over zone polygon envelopes
 */

#include "rx_point_enricher.hpp"
#include "ZoneLayer.hpp"
#include "Logger.hpp"
#include <geos_c.h>
#include <memory>
#include <vector>

namespace rxgis {

/**
 * @brief Spatial index answering "which zone contains this point"
 *
 * Built once from a zone set: each polygon is converted to GEOS through WKB
 * (so GDAL does not need its own GEOS linkage), prepared for containment
 * tests, and its envelope is inserted into an STRtree. Queries sort the
 * envelope hits by storage index so the first polygon in layer order wins.
 *
 * The tree is built eagerly in the constructor; after that queries do not
 * modify it. A ZoneRtree owns its GEOS context and must be queried from one
 * thread at a time.
 */
class ZoneRtree {
public:
    /**
     * @throws std::runtime_error if the GEOS context, tree or a polygon
     *         conversion cannot be created
     */
    explicit ZoneRtree(const ZonePolygonSet& zones, unsigned int node_capacity = 10);
    ~ZoneRtree();

    ZoneRtree(const ZoneRtree&) = delete;
    ZoneRtree& operator=(const ZoneRtree&) = delete;

    /**
     * @brief Zone id of the first containing polygon, 0 if none
     */
    int find_zone(double x, double y) const;

    /**
     * @brief One query per point, same order as the batch
     */
    std::vector<int> find_zones(const CoordinateBatch& coords) const;

    size_t size() const { return entries_.size(); }

private:
    struct Entry {
        size_t storage_index = 0;
        int zone_id = 0;
        GEOSGeometry* geometry = nullptr;
        const GEOSPreparedGeometry* prepared = nullptr;
        GEOSGeometry* envelope = nullptr;
    };

    GEOSContextHandle_t context_;
    GEOSSTRtree* tree_;
    std::vector<std::unique_ptr<Entry>> entries_;
    Logger logger_;

    GEOSGeometry* to_geos(const OGRGeometry& geometry) const;
    void clear();

    static void collect(void* item, void* userdata);
};

} // namespace rxgis
