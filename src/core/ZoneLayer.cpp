/**
 * @file ZoneLayer.cpp
 * @brief OGR loading of regulatory zone polygons
 */

#include "ZoneLayer.hpp"
#include "GdalHandles.hpp"
#include "ExtractionErrors.hpp"
#include <ogrsf_frmts.h>
#include <ogr_spatialref.h>
#include <sstream>

namespace rxgis {

bool ZonePolygonSet::add(int zone_id, OGRGeometryUniquePtr geometry) {
    if (!geometry) {
        return false;
    }

    const OGRwkbGeometryType type = wkbFlatten(geometry->getGeometryType());
    if (type != wkbPolygon && type != wkbMultiPolygon) {
        return false;
    }

    ZonePolygon zone;
    zone.zone_id = zone_id;
    zone.storage_index = polygons.size();
    geometry->getEnvelope(&zone.envelope);
    zone.geometry = std::move(geometry);
    polygons.push_back(std::move(zone));
    return true;
}

ZoneLayerLoader::ZoneLayerLoader() : logger_("ZoneLayer") {
    ensure_gdal_registered();
}

ZonePolygonSet ZoneLayerLoader::load(const std::string& path, const std::string& id_field) const {
    if (path.empty()) {
        throw ZoneLayerUnavailable("no zone layer path configured");
    }

    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        throw ZoneLayerUnavailable("failed to open " + path);
    }

    OGRLayer* layer = dataset->GetLayer(0);
    if (!layer) {
        throw ZoneLayerUnavailable(path + " contains no vector layer");
    }

    const int field_index = layer->GetLayerDefn()->GetFieldIndex(id_field.c_str());
    if (field_index < 0) {
        throw ZoneLayerUnavailable(path + " has no field '" + id_field + "'");
    }

    ZonePolygonSet zones;
    zones.source_path = path;

    if (const OGRSpatialReference* srs = layer->GetSpatialRef()) {
        char* wkt = nullptr;
        if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
            zones.crs_wkt = wkt;
        }
        CPLFree(wkt);
    }
    if (zones.crs_wkt.empty()) {
        logger_.warning(path + " declares no CRS");
    }

    size_t without_polygon = 0;
    size_t without_id = 0;
    layer->ResetReading();
    OGRFeature* raw_feature = nullptr;
    while ((raw_feature = layer->GetNextFeature()) != nullptr) {
        OGRFeatureUniquePtr feature(raw_feature);

        // An unset id would read as 0, which means "no zone"
        if (!feature->IsFieldSetAndNotNull(field_index)) {
            without_id++;
            continue;
        }

        const int zone_id = feature->GetFieldAsInteger(field_index);
        OGRGeometryUniquePtr geometry(feature->StealGeometry());
        if (!zones.add(zone_id, std::move(geometry))) {
            without_polygon++;
        }
    }

    zones.skipped_features = without_polygon + without_id;
    if (without_polygon > 0) {
        logger_.debug("Skipped " + std::to_string(without_polygon) + " features without polygon geometry");
    }
    if (without_id > 0) {
        logger_.warning("Skipped " + std::to_string(without_id) + " features with no " + id_field + " value");
    }
    logger_.info("Loaded " + std::to_string(zones.size()) + " zone polygons from " + path);

    return zones;
}

ZoneLayerReport validate_zone_layer(const ZonePolygonSet& zones, const std::vector<int>& expected_zone_ids,
                                    const Logger& logger) {
    ZoneLayerReport report;
    for (const auto& zone : zones.polygons) {
        report.polygons_per_zone[zone.zone_id]++;
    }

    std::ostringstream distribution;
    distribution << "Zone distribution:";
    for (const auto& [zone_id, count] : report.polygons_per_zone) {
        distribution << ' ' << zone_id << '=' << count;
    }
    logger.detailed(distribution.str());

    for (int expected : expected_zone_ids) {
        if (report.polygons_per_zone.count(expected) == 0) {
            report.missing_zone_ids.push_back(expected);
        }
    }

    if (!report.missing_zone_ids.empty()) {
        std::ostringstream missing;
        missing << "Zone layer " << zones.source_path << " has no polygons for expected zone id(s):";
        for (int zone_id : report.missing_zone_ids) {
            missing << ' ' << zone_id;
        }
        logger.warning(missing.str());
    }

    return report;
}

} // namespace rxgis
