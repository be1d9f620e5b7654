/**
 * @file CrsReconciler.cpp
 * @brief Batched CRS transforms for point coordinates and zone polygons
 */

#include "CrsReconciler.hpp"
#include "ZoneLayer.hpp"
#include "ExtractionErrors.hpp"
#include <cmath>
#include <limits>

namespace rxgis {

CrsReconciler::CrsReconciler(const std::string& working_crs)
    : working_(parse(working_crs, "receiver points")),
      logger_("CrsReconciler") {
}

std::string CrsReconciler::working_wkt() const {
    char* wkt = nullptr;
    if (working_.exportToWkt(&wkt) != OGRERR_NONE || wkt == nullptr) {
        CPLFree(wkt);
        return "";
    }
    std::string result(wkt);
    CPLFree(wkt);
    return result;
}

OGRSpatialReference CrsReconciler::parse(const std::string& definition, const std::string& layer_name) {
    if (definition.empty()) {
        throw CoordinateReferenceMismatch(layer_name + " has no coordinate reference system");
    }

    OGRSpatialReference srs;
    if (srs.SetFromUserInput(definition.c_str()) != OGRERR_NONE) {
        throw CoordinateReferenceMismatch("cannot parse CRS of " + layer_name + ": " + definition);
    }
    srs.SetAxisMappingStrategy(OAMS_TRADITIONAL_GIS_ORDER);
    return srs;
}

bool CrsReconciler::matches(const std::string& layer_crs, const std::string& layer_name) const {
    const OGRSpatialReference layer_srs = parse(layer_crs, layer_name);
    return layer_srs.IsSame(&working_) != FALSE;
}

CoordinateTransformationPtr CrsReconciler::make_transformation(const OGRSpatialReference& source,
                                                               const OGRSpatialReference& target,
                                                               const std::string& layer_name) const {
    CoordinateTransformationPtr transformation(OGRCreateCoordinateTransformation(&source, &target));
    if (!transformation) {
        throw CoordinateReferenceMismatch("no transformation available for " + layer_name);
    }
    return transformation;
}

CoordinateBatch CrsReconciler::to_layer(const CoordinateBatch& coords,
                                        const std::string& layer_crs,
                                        const std::string& layer_name) const {
    const OGRSpatialReference layer_srs = parse(layer_crs, layer_name);
    if (layer_srs.IsSame(&working_)) {
        logger_.detailed(layer_name + " shares the working CRS, no transform needed");
        return coords;
    }

    auto transformation = make_transformation(working_, layer_srs, layer_name);

    CoordinateBatch projected = coords;
    if (projected.size() == 0) {
        return projected;
    }

    std::vector<int> success(projected.size(), FALSE);
    transformation->Transform(projected.size(), projected.x.data(), projected.y.data(),
                              nullptr, success.data());

    size_t failed = 0;
    for (size_t i = 0; i < projected.size(); ++i) {
        if (!success[i] || !std::isfinite(projected.x[i]) || !std::isfinite(projected.y[i])) {
            projected.x[i] = std::numeric_limits<double>::quiet_NaN();
            projected.y[i] = std::numeric_limits<double>::quiet_NaN();
            failed++;
        }
    }

    if (failed == projected.size()) {
        throw CoordinateReferenceMismatch("every point failed to transform into " + layer_name + " CRS");
    }
    if (failed > 0) {
        logger_.warning(std::to_string(failed) + " of " + std::to_string(projected.size()) +
                        " points could not be transformed into " + layer_name + " CRS");
    }

    logger_.detailed("Transformed " + std::to_string(projected.size()) + " points into " + layer_name + " CRS");
    return projected;
}

void CrsReconciler::to_working(ZonePolygonSet& zones) const {
    const OGRSpatialReference zone_srs = parse(zones.crs_wkt, "zone layer");
    if (zone_srs.IsSame(&working_)) {
        logger_.detailed("Zone layer shares the working CRS, no reprojection needed");
        return;
    }

    auto transformation = make_transformation(zone_srs, working_, "zone layer");

    for (auto& zone : zones.polygons) {
        if (zone.geometry->transform(transformation.get()) != OGRERR_NONE) {
            throw CoordinateReferenceMismatch("failed to reproject zone " + std::to_string(zone.zone_id));
        }
        zone.geometry->getEnvelope(&zone.envelope);
    }

    zones.crs_wkt = working_wkt();
    logger_.info("Reprojected " + std::to_string(zones.polygons.size()) + " zone polygons into the working CRS");
}

} // namespace rxgis
