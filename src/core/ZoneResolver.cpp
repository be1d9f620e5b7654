/**
 * @file ZoneResolver.cpp
 * @brief Batch spatial join and indexed fallback for zone assignment
 */

#include "ZoneResolver.hpp"
#include "ZoneRtree.hpp"
#include <ogr_api.h>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <type_traits>

namespace rxgis {

namespace {

struct PreparedGeometryDeleter {
    void operator()(OGRPreparedGeometryH prepared) const {
        if (prepared) {
            OGRDestroyPreparedGeometry(prepared);
        }
    }
};

using PreparedGeometryPtr =
    std::unique_ptr<std::remove_pointer_t<OGRPreparedGeometryH>, PreparedGeometryDeleter>;

} // anonymous namespace

std::string to_string(ZoneJoinStrategy strategy) {
    switch (strategy) {
        case ZoneJoinStrategy::BATCH_JOIN: return "batch_join";
        case ZoneJoinStrategy::INDEXED_LOOKUP: return "indexed_lookup";
    }
    return "unknown";
}

// ============================================================================
// BatchSpatialJoin
// ============================================================================

BatchSpatialJoin::BatchSpatialJoin() : logger_("ZoneResolver") {
}

std::vector<int> BatchSpatialJoin::resolve(const CoordinateBatch& coords, const ZonePolygonSet& zones) const {
    const size_t n = coords.size();
    std::vector<int> zone_ids(n, 0);
    if (n == 0 || zones.empty()) {
        return zone_ids;
    }

    // Sort finite points by x once
    std::vector<size_t> order;
    order.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        if (std::isfinite(coords.x[i]) && std::isfinite(coords.y[i])) {
            order.push_back(i);
        }
    }
    std::stable_sort(order.begin(), order.end(),
                     [&coords](size_t a, size_t b) { return coords.x[a] < coords.x[b]; });

    std::vector<double> sorted_x(order.size());
    for (size_t k = 0; k < order.size(); ++k) {
        sorted_x[k] = coords.x[order[k]];
    }

    std::vector<std::uint8_t> assigned(n, 0);
    size_t assigned_count = 0;
    OGRPoint probe;

    for (const auto& zone : zones.polygons) {
        if (assigned_count == order.size()) {
            break;
        }

        const OGREnvelope& env = zone.envelope;
        auto first = std::lower_bound(sorted_x.begin(), sorted_x.end(), env.MinX);
        auto last = std::upper_bound(first, sorted_x.end(), env.MaxX);
        if (first == last) {
            continue;
        }

        PreparedGeometryPtr prepared(OGRCreatePreparedGeometry(OGRGeometry::ToHandle(zone.geometry.get())));
        if (!prepared) {
            throw std::runtime_error("cannot prepare geometry of zone " + std::to_string(zone.zone_id));
        }

        for (auto it = first; it != last; ++it) {
            const size_t index = order[static_cast<size_t>(it - sorted_x.begin())];
            if (assigned[index]) {
                continue;
            }

            const double y = coords.y[index];
            if (y < env.MinY || y > env.MaxY) {
                continue;
            }

            probe.setX(coords.x[index]);
            probe.setY(y);
            if (OGRPreparedGeometryContains(prepared.get(), OGRGeometry::ToHandle(&probe))) {
                zone_ids[index] = zone.zone_id;
                assigned[index] = 1;
                assigned_count++;
            }
        }
    }

    logger_.detailed("Batch join assigned " + std::to_string(assigned_count) + " of " +
                     std::to_string(n) + " points to " + std::to_string(zones.size()) + " zones");
    return zone_ids;
}

// ============================================================================
// IndexedZoneLookup
// ============================================================================

IndexedZoneLookup::IndexedZoneLookup() : logger_("ZoneResolver") {
}

std::vector<int> IndexedZoneLookup::resolve(const CoordinateBatch& coords, const ZonePolygonSet& zones) const {
    if (coords.size() == 0 || zones.empty()) {
        return std::vector<int>(coords.size(), 0);
    }

    const ZoneRtree tree(zones);
    std::vector<int> zone_ids = tree.find_zones(coords);

    const auto resolved = std::count_if(zone_ids.begin(), zone_ids.end(), [](int id) { return id != 0; });
    logger_.detailed("Indexed lookup assigned " + std::to_string(resolved) + " of " +
                     std::to_string(coords.size()) + " points using an STRtree of " +
                     std::to_string(tree.size()) + " polygons");
    return zone_ids;
}

// ============================================================================
// ZoneResolver
// ============================================================================

ZoneResolver::ZoneResolver(std::optional<ZoneJoinStrategy> forced)
    : forced_(forced), logger_("ZoneResolver") {
}

bool ZoneResolver::batch_join_supported() {
    return OGRHasPreparedGeometrySupport() != FALSE;
}

std::unique_ptr<ZoneLookup> ZoneResolver::make_lookup(ZoneJoinStrategy strategy) {
    switch (strategy) {
        case ZoneJoinStrategy::BATCH_JOIN:
            return std::make_unique<BatchSpatialJoin>();
        case ZoneJoinStrategy::INDEXED_LOOKUP:
            return std::make_unique<IndexedZoneLookup>();
    }
    throw std::invalid_argument("unknown zone join strategy");
}

ZoneResolution ZoneResolver::resolve(const CoordinateBatch& coords, const ZonePolygonSet& zones) const {
    ZoneResolution resolution;

    if (forced_) {
        resolution.strategy = *forced_;
        logger_.detailed("Zone strategy forced to " + to_string(resolution.strategy));
    } else if (batch_join_supported()) {
        resolution.strategy = ZoneJoinStrategy::BATCH_JOIN;
    } else {
        resolution.strategy = ZoneJoinStrategy::INDEXED_LOOKUP;
        logger_.detailed("Prepared geometries unavailable in OGR runtime, using indexed lookup");
    }

    if (resolution.strategy == ZoneJoinStrategy::BATCH_JOIN) {
        try {
            resolution.zone_ids = make_lookup(ZoneJoinStrategy::BATCH_JOIN)->resolve(coords, zones);
            return resolution;
        } catch (const std::exception& e) {
            logger_.warning("Batch join failed (" + std::string(e.what()) +
                            "), rerunning batch through indexed lookup");
            resolution.strategy = ZoneJoinStrategy::INDEXED_LOOKUP;
            resolution.fell_back = true;
        }
    }

    resolution.zone_ids = make_lookup(ZoneJoinStrategy::INDEXED_LOOKUP)->resolve(coords, zones);
    return resolution;
}

} // namespace rxgis
