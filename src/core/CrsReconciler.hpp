#pragma once

/**
 * @file CrsReconciler.hpp
 * @brief Coordinate reference system reconciliation between input layers
 */

#include "rx_point_enricher.hpp"
#include "Logger.hpp"
#include <ogr_spatialref.h>
#include <memory>
#include <string>

namespace rxgis {

struct ZonePolygonSet;

struct CoordinateTransformationDeleter {
    void operator()(OGRCoordinateTransformation* transformation) const {
        if (transformation) {
            OGRCoordinateTransformation::DestroyCT(transformation);
        }
    }
};

using CoordinateTransformationPtr =
    std::unique_ptr<OGRCoordinateTransformation, CoordinateTransformationDeleter>;

/**
 * @brief Reconciles layer CRSs against one working CRS
 *
 * The working CRS is the receiver batch's declared CRS. Raster lookups
 * transform the point batch into the raster's CRS (rasters are never
 * resampled); zone polygons are transformed into the working CRS. Each
 * reconciliation happens once per layer per extraction call.
 *
 * All spatial references use traditional GIS axis order (x=lon, y=lat).
 */
class CrsReconciler {
public:
    /**
     * @param working_crs Definition accepted by SetFromUserInput (EPSG code, WKT, PROJ)
     * @throws CoordinateReferenceMismatch if the definition cannot be parsed
     */
    explicit CrsReconciler(const std::string& working_crs);

    const OGRSpatialReference& working() const { return working_; }
    std::string working_wkt() const;

    /**
     * @brief Check whether a layer CRS is equivalent to the working CRS
     * @throws CoordinateReferenceMismatch if layer_crs is empty or unparseable
     */
    bool matches(const std::string& layer_crs, const std::string& layer_name) const;

    /**
     * @brief Transform working-CRS coordinates into a layer's CRS
     *
     * Points that cannot be transformed come back as NaN and are later
     * treated as out of bounds.
     *
     * @throws CoordinateReferenceMismatch if no transformation exists or
     *         every point of a non-empty batch fails
     */
    CoordinateBatch to_layer(const CoordinateBatch& coords,
                             const std::string& layer_crs,
                             const std::string& layer_name) const;

    /**
     * @brief Reproject zone polygons into the working CRS in place
     * @throws CoordinateReferenceMismatch on undefined CRS or failed transform
     */
    void to_working(ZonePolygonSet& zones) const;

    /**
     * @brief Parse a CRS definition with traditional axis order
     * @throws CoordinateReferenceMismatch if empty or invalid
     */
    static OGRSpatialReference parse(const std::string& definition, const std::string& layer_name);

private:
    OGRSpatialReference working_;
    Logger logger_;

    CoordinateTransformationPtr make_transformation(const OGRSpatialReference& source,
                                                    const OGRSpatialReference& target,
                                                    const std::string& layer_name) const;
};

} // namespace rxgis
