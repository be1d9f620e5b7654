#pragma once

/**
 * @file ZoneResolver.hpp
 * @brief Point-in-polygon zone assignment with a probe-selected strategy
 */

#include "rx_point_enricher.hpp"
#include "ZoneLayer.hpp"
#include "Logger.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rxgis {

enum class ZoneJoinStrategy {
    BATCH_JOIN,      // Sorted sweep with OGR prepared geometries
    INDEXED_LOOKUP   // GEOS STRtree, one query per point
};

std::string to_string(ZoneJoinStrategy strategy);

/**
 * @brief Zone ids for a coordinate batch, same order as the input
 */
struct ZoneResolution {
    std::vector<int> zone_ids;
    ZoneJoinStrategy strategy = ZoneJoinStrategy::BATCH_JOIN;
    bool fell_back = false;  // Batch join was attempted and failed
};

/**
 * @brief One way of assigning zone ids to a whole batch
 *
 * Implementations must return 0 for points outside every polygon and, where
 * polygons overlap, the id of the first polygon in storage order.
 */
class ZoneLookup {
public:
    virtual ~ZoneLookup() = default;

    virtual std::vector<int> resolve(const CoordinateBatch& coords, const ZonePolygonSet& zones) const = 0;
    virtual ZoneJoinStrategy strategy() const = 0;
};

/**
 * @brief Batch spatial join
 *
 * Points are sorted by x once. Each polygon, in storage order, selects the
 * x slab of its envelope by binary search, filters it by y and tests the
 * survivors with a prepared geometry. Points already assigned are skipped.
 */
class BatchSpatialJoin : public ZoneLookup {
public:
    BatchSpatialJoin();

    std::vector<int> resolve(const CoordinateBatch& coords, const ZonePolygonSet& zones) const override;
    ZoneJoinStrategy strategy() const override { return ZoneJoinStrategy::BATCH_JOIN; }

private:
    Logger logger_;
};

/**
 * @brief Per-point lookup against a GEOS STRtree built once per batch
 */
class IndexedZoneLookup : public ZoneLookup {
public:
    IndexedZoneLookup();

    std::vector<int> resolve(const CoordinateBatch& coords, const ZonePolygonSet& zones) const override;
    ZoneJoinStrategy strategy() const override { return ZoneJoinStrategy::INDEXED_LOOKUP; }

private:
    Logger logger_;
};

/**
 * @brief Chooses a zone lookup strategy and runs it over a batch
 *
 * The batch join is used when the OGR runtime offers prepared geometries.
 * If the batch join fails, the whole batch is rerun through the indexed
 * lookup. Coordinates and polygons must already share one CRS.
 */
class ZoneResolver {
public:
    /**
     * @param forced Skip the probe and always use this strategy
     */
    explicit ZoneResolver(std::optional<ZoneJoinStrategy> forced = std::nullopt);

    ZoneResolution resolve(const CoordinateBatch& coords, const ZonePolygonSet& zones) const;

    /**
     * @brief Capability probe for the batch join
     */
    static bool batch_join_supported();

private:
    std::optional<ZoneJoinStrategy> forced_;
    Logger logger_;

    static std::unique_ptr<ZoneLookup> make_lookup(ZoneJoinStrategy strategy);
};

} // namespace rxgis
