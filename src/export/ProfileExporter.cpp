/**
 * @file ProfileExporter.cpp
 * @brief Implementation of P.1812 profile export
 */

#include "ProfileExporter.hpp"
#include "../core/Logger.hpp"
#include <algorithm>
#include <fstream>
#include <iomanip>
#include <map>

namespace rxgis {

namespace {

template<typename T>
void write_list(std::ostream& out, const std::vector<T>& values) {
    out << "\"[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) out << ", ";
        out << values[i];
    }
    out << "]\"";
}

} // anonymous namespace

std::vector<PathProfile> build_profiles(const std::vector<EnrichedPoint>& records) {
    std::vector<std::vector<const EnrichedPoint*>> groups;
    std::map<std::pair<std::string, int>, size_t> group_index;

    for (const auto& record : records) {
        const auto key = std::make_pair(record.point.tx_id, record.point.id.azimuth_index);
        auto it = group_index.find(key);
        if (it == group_index.end()) {
            it = group_index.emplace(key, groups.size()).first;
            groups.emplace_back();
        }
        groups[it->second].push_back(&record);
    }

    std::vector<PathProfile> profiles;
    profiles.reserve(groups.size());

    for (auto& group : groups) {
        std::stable_sort(group.begin(), group.end(), [](const EnrichedPoint* a, const EnrichedPoint* b) {
            return a->point.id.distance_index < b->point.id.distance_index;
        });

        PathProfile profile;
        profile.tx_id = group.front()->point.tx_id;
        profile.azimuth_index = group.front()->point.id.azimuth_index;
        profile.azimuth_deg = group.front()->point.azimuth_deg;

        for (const EnrichedPoint* record : group) {
            profile.distances_km.push_back(record->point.distance_km);
            profile.heights.push_back(record->elevation);
            profile.resistances.push_back(record->resistance);
            profile.categories.push_back(record->category);
            profile.zones.push_back(record->zone_id);
        }

        profile.rx_lon = group.back()->point.lon;
        profile.rx_lat = group.back()->point.lat;
        profiles.push_back(std::move(profile));
    }

    return profiles;
}

ProfileExporter::Parameters ProfileExporter::Parameters::from_config(const EnrichmentConfig& config) {
    Parameters parameters;
    parameters.frequency_ghz = config.frequency_ghz;
    parameters.time_percentage = config.time_percentage;
    parameters.polarization = config.polarization;
    parameters.antenna_height_tx = config.antenna_height_tx;
    parameters.antenna_height_rx = config.antenna_height_rx;
    parameters.tx_lon = config.tx_longitude;
    parameters.tx_lat = config.tx_latitude;
    return parameters;
}

ProfileExporter::ProfileExporter(const Parameters& parameters)
    : parameters_(parameters) {}

void ProfileExporter::write(std::ostream& out, const std::vector<PathProfile>& profiles) const {
    out << "f,p,d,h,R,Ct,zone,htg,hrg,pol,phi_t,phi_r,lam_t,lam_r,azimuth\n";

    for (const auto& profile : profiles) {
        out << std::setprecision(10) << std::defaultfloat
            << parameters_.frequency_ghz << ','
            << parameters_.time_percentage << ',';

        write_list(out, profile.distances_km); out << ',';
        write_list(out, profile.heights); out << ',';
        write_list(out, profile.resistances); out << ',';
        write_list(out, profile.categories); out << ',';
        write_list(out, profile.zones); out << ',';

        out << parameters_.antenna_height_tx << ','
            << parameters_.antenna_height_rx << ','
            << parameters_.polarization << ','
            << parameters_.tx_lat << ','
            << profile.rx_lat << ','
            << parameters_.tx_lon << ','
            << profile.rx_lon << ','
            << profile.azimuth_deg << '\n';
    }
}

bool ProfileExporter::export_profiles(const std::vector<EnrichedPoint>& records,
                                      const std::string& filename) const {
    Logger logger("ProfileExporter");

    const auto profiles = build_profiles(records);

    std::ofstream file(filename);
    if (!file.is_open()) {
        logger.error("Failed to create profile file: " + filename);
        return false;
    }

    write(file, profiles);
    file.close();

    if (file.fail()) {
        logger.error("Failed while writing profile file: " + filename);
        return false;
    }

    logger.info("Exported " + std::to_string(profiles.size()) + " path profiles: " + filename);
    return true;
}

} // namespace rxgis
