/**
 * @file PointReader.cpp
 * @brief OGR point layer reader
 */

#include "PointReader.hpp"
#include "GdalHandles.hpp"
#include <ogrsf_frmts.h>
#include <stdexcept>

namespace rxgis {

PointReader::PointReader() : logger_("PointReader") {
    ensure_gdal_registered();
}

ReceiverBatch PointReader::read(const std::string& path) const {
    GDALDatasetPtr dataset(static_cast<GDALDataset*>(
        GDALOpenEx(path.c_str(), GDAL_OF_VECTOR | GDAL_OF_READONLY, nullptr, nullptr, nullptr)));
    if (!dataset) {
        throw std::runtime_error("Failed to open receiver points: " + path);
    }

    OGRLayer* layer = dataset->GetLayer(0);
    if (!layer) {
        throw std::runtime_error("Receiver point source has no layer: " + path);
    }

    ReceiverBatch batch;
    if (const OGRSpatialReference* srs = layer->GetSpatialRef()) {
        char* wkt = nullptr;
        if (srs->exportToWkt(&wkt) == OGRERR_NONE && wkt) {
            batch.crs = wkt;
        }
        CPLFree(wkt);
    } else {
        logger_.detailed(path + " declares no CRS, assuming EPSG:4326");
    }

    OGRFeatureDefn* defn = layer->GetLayerDefn();
    const int azimuth_index_field = defn->GetFieldIndex("azimuth_index");
    const int distance_index_field = defn->GetFieldIndex("distance_index");
    const int azimuth_field = defn->GetFieldIndex("azimuth_deg");
    const int distance_field = defn->GetFieldIndex("distance_km");
    const int tx_field = defn->GetFieldIndex("tx_id");
    const int rx_field = defn->GetFieldIndex("rx_id");

    size_t skipped = 0;
    layer->ResetReading();
    OGRFeature* raw_feature = nullptr;
    while ((raw_feature = layer->GetNextFeature()) != nullptr) {
        OGRFeatureUniquePtr feature(raw_feature);

        const OGRGeometry* geometry = feature->GetGeometryRef();
        if (!geometry || wkbFlatten(geometry->getGeometryType()) != wkbPoint || geometry->IsEmpty()) {
            skipped++;
            continue;
        }

        const OGRPoint* location = geometry->toPoint();
        ReceiverPoint point(location->getX(), location->getY(), PointId());

        if (azimuth_index_field >= 0) point.id.azimuth_index = feature->GetFieldAsInteger(azimuth_index_field);
        if (distance_index_field >= 0) point.id.distance_index = feature->GetFieldAsInteger(distance_index_field);
        if (azimuth_field >= 0) point.azimuth_deg = feature->GetFieldAsDouble(azimuth_field);
        if (distance_field >= 0) point.distance_km = feature->GetFieldAsDouble(distance_field);
        if (tx_field >= 0) point.tx_id = feature->GetFieldAsString(tx_field);
        point.rx_id = rx_field >= 0 ? feature->GetFieldAsInteger(rx_field)
                                    : static_cast<int>(batch.points.size()) + 1;

        batch.points.push_back(std::move(point));
    }

    if (skipped > 0) {
        logger_.warning("Skipped " + std::to_string(skipped) + " features without point geometry in " + path);
    }
    logger_.info("Read " + std::to_string(batch.size()) + " receiver points from " + path);
    return batch;
}

} // namespace rxgis
