/**
 * @file ZoneRtree.cpp
 * @brief GEOS-backed zone index used by the per-point fallback
 */

#include "ZoneRtree.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace rxgis {

ZoneRtree::ZoneRtree(const ZonePolygonSet& zones, unsigned int node_capacity)
    : context_(GEOS_init_r()), tree_(nullptr), logger_("ZoneRtree") {
    if (!context_) {
        throw std::runtime_error("Failed to create GEOS context");
    }

    tree_ = GEOSSTRtree_create_r(context_, node_capacity);
    if (!tree_) {
        GEOS_finish_r(context_);
        throw std::runtime_error("Failed to create GEOS STRtree");
    }

    try {
        for (const auto& zone : zones.polygons) {
            auto entry = std::make_unique<Entry>();
            entry->storage_index = zone.storage_index;
            entry->zone_id = zone.zone_id;
            entry->geometry = to_geos(*zone.geometry);

            entry->prepared = GEOSPrepare_r(context_, entry->geometry);
            if (!entry->prepared) {
                GEOSGeom_destroy_r(context_, entry->geometry);
                throw std::runtime_error("Failed to prepare zone " + std::to_string(zone.zone_id));
            }

            entry->envelope = GEOSEnvelope_r(context_, entry->geometry);
            if (!entry->envelope) {
                GEOSPreparedGeom_destroy_r(context_, entry->prepared);
                GEOSGeom_destroy_r(context_, entry->geometry);
                throw std::runtime_error("Failed to compute envelope of zone " + std::to_string(zone.zone_id));
            }

            GEOSSTRtree_insert_r(context_, tree_, entry->envelope, entry.get());
            entries_.push_back(std::move(entry));
        }

        // The STRtree is built lazily on its first query; force it here so
        // later queries are read-only
        if (!entries_.empty()) {
            std::vector<Entry*> ignored;
            GEOSSTRtree_query_r(context_, tree_, entries_.front()->envelope, collect, &ignored);
        }
    } catch (...) {
        clear();
        GEOS_finish_r(context_);
        throw;
    }

    logger_.debug("Built STRtree over " + std::to_string(entries_.size()) +
                  " zone polygons, node capacity " + std::to_string(node_capacity));
}

ZoneRtree::~ZoneRtree() {
    clear();
    GEOS_finish_r(context_);
}

void ZoneRtree::clear() {
    if (tree_) {
        GEOSSTRtree_destroy_r(context_, tree_);
        tree_ = nullptr;
    }
    for (auto& entry : entries_) {
        GEOSPreparedGeom_destroy_r(context_, entry->prepared);
        GEOSGeom_destroy_r(context_, entry->envelope);
        GEOSGeom_destroy_r(context_, entry->geometry);
    }
    entries_.clear();
}

GEOSGeometry* ZoneRtree::to_geos(const OGRGeometry& geometry) const {
    std::vector<unsigned char> wkb(static_cast<size_t>(geometry.WkbSize()));
    if (geometry.exportToWkb(wkbNDR, wkb.data()) != OGRERR_NONE) {
        throw std::runtime_error("Failed to export zone geometry to WKB");
    }

    GEOSWKBReader* reader = GEOSWKBReader_create_r(context_);
    if (!reader) {
        throw std::runtime_error("Failed to create GEOS WKB reader");
    }
    GEOSGeometry* result = GEOSWKBReader_read_r(context_, reader, wkb.data(), wkb.size());
    GEOSWKBReader_destroy_r(context_, reader);

    if (!result) {
        throw std::runtime_error("GEOS could not read zone geometry");
    }
    return result;
}

void ZoneRtree::collect(void* item, void* userdata) {
    auto* hits = static_cast<std::vector<Entry*>*>(userdata);
    hits->push_back(static_cast<Entry*>(item));
}

int ZoneRtree::find_zone(double x, double y) const {
    GEOSGeometry* point = GEOSGeom_createPointFromXY_r(context_, x, y);
    if (!point) {
        throw std::runtime_error("Failed to create GEOS point");
    }

    std::vector<Entry*> hits;
    GEOSSTRtree_query_r(context_, tree_, point, collect, &hits);

    std::sort(hits.begin(), hits.end(),
              [](const Entry* a, const Entry* b) { return a->storage_index < b->storage_index; });

    int zone_id = 0;
    for (const Entry* entry : hits) {
        const char contained = GEOSPreparedContains_r(context_, entry->prepared, point);
        if (contained == 2) {
            GEOSGeom_destroy_r(context_, point);
            throw std::runtime_error("GEOS containment test failed for zone " + std::to_string(entry->zone_id));
        }
        if (contained == 1) {
            zone_id = entry->zone_id;
            break;
        }
    }

    GEOSGeom_destroy_r(context_, point);
    return zone_id;
}

std::vector<int> ZoneRtree::find_zones(const CoordinateBatch& coords) const {
    std::vector<int> zone_ids(coords.size(), 0);
    for (size_t i = 0; i < coords.size(); ++i) {
        if (std::isfinite(coords.x[i]) && std::isfinite(coords.y[i])) {
            zone_ids[i] = find_zone(coords.x[i], coords.y[i]);
        }
    }
    return zone_ids;
}

} // namespace rxgis
