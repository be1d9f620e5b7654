/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the enrichment pipeline
 */

#include "ConfigurationManager.hpp"
#include "ExtractionErrors.hpp"
#include "../core/CodeMapping.hpp"
#include <fstream>

using json = nlohmann::json;

namespace rxgis {

namespace {

const json& require_section(const json& document, const char* section) {
    if (!document.contains(section) || !document[section].is_object()) {
        throw ConfigurationError(std::string("missing section ") + section);
    }
    return document[section];
}

template<typename T>
void read_value(const json& section, const char* section_name, const char* key, T& target) {
    if (!section.contains(key) || section[key].is_null()) {
        return;
    }
    try {
        target = section[key].get<T>();
    } catch (const json::exception&) {
        throw ConfigurationError(std::string(section_name) + "." + key + " has the wrong type");
    }
}

int parse_mapping_key(const std::string& key, const char* section) {
    size_t consumed = 0;
    int value = 0;
    try {
        value = std::stoi(key, &consumed);
    } catch (const std::exception&) {
        throw ConfigurationError(std::string(section) + " key '" + key + "' is not an integer");
    }
    if (consumed != key.size()) {
        throw ConfigurationError(std::string(section) + " key '" + key + "' is not an integer");
    }
    return value;
}

} // anonymous namespace

ConfigurationManager::ConfigurationManager()
    : document_(default_config()) {}

json ConfigurationManager::default_config() {
    const CodeMappingTable mapping = default_worldcover_mapping();

    json lcm10_to_ct = json::object();
    for (const auto& [raw_class, category] : mapping.class_to_category) {
        lcm10_to_ct[std::to_string(raw_class)] = category;
    }

    json ct_to_r = json::object();
    for (const auto& [category, resistance] : mapping.category_to_resistance) {
        ct_to_r[std::to_string(category)] = resistance;
    }

    return {
        {"TRANSMITTER", {
            {"tx_id", "TX_0001"},
            {"longitude", -13.40694},
            {"latitude", 9.345},
            {"antenna_height_tx", 57.0},
            {"antenna_height_rx", 10.0}
        }},
        {"P1812", {
            {"frequency_ghz", 0.9},
            {"time_percentage", 50.0},
            {"polarization", 1}
        }},
        {"RECEIVER_GENERATION", {
            {"layout", "radial"},
            {"max_distance_km", 11.0},
            {"azimuth_step", 10.0},
            {"distance_step", 0.03},
            {"sampling_resolution", 30.0},
            {"include_tx_point", true},
            {"num_points", 500},
            {"scale_m", 1000.0}
        }},
        {"DATA", {
            {"elevation_raster", ""},
            {"landcover_raster", ""},
            {"zone_layer", ""},
            {"zone_id_field", "zone_type_id"},
            {"expected_zone_ids", json::array({1, 3, 4})},
            {"points_file", nullptr}
        }},
        {"EXTRACTION", {
            {"elevation_sentinel", -9999.0},
            {"landcover_sentinel", 255.0},
            {"default_category", mapping.default_category},
            {"default_resistance", mapping.default_resistance},
            {"parallel_processing", true}
        }},
        {"LCM10_TO_CT", lcm10_to_ct},
        {"CT_TO_R", ct_to_r},
        {"OUTPUT", {
            {"directory", "output"},
            {"base_name", "receivers"},
            {"formats", json::array({"csv"})}
        }}
    };
}

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    json overrides;
    try {
        file >> overrides;
    } catch (const json::parse_error& e) {
        throw ConfigurationError("cannot parse " + filename + ": " + e.what());
    }

    merge(overrides);
    return true;
}

void ConfigurationManager::merge(const json& overrides) {
    if (!overrides.is_object()) {
        throw ConfigurationError("configuration root must be a JSON object");
    }
    // RFC 7396 merge patch: objects merge recursively, other values replace
    document_.merge_patch(overrides);
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    file << document_.dump(2) << std::endl;
    return !file.fail();
}

EnrichmentConfig ConfigurationManager::to_enrichment_config() const {
    EnrichmentConfig config;

    const json& tx = require_section(document_, "TRANSMITTER");
    read_value(tx, "TRANSMITTER", "tx_id", config.tx_id);
    read_value(tx, "TRANSMITTER", "longitude", config.tx_longitude);
    read_value(tx, "TRANSMITTER", "latitude", config.tx_latitude);
    read_value(tx, "TRANSMITTER", "antenna_height_tx", config.antenna_height_tx);
    read_value(tx, "TRANSMITTER", "antenna_height_rx", config.antenna_height_rx);

    const json& p1812 = require_section(document_, "P1812");
    read_value(p1812, "P1812", "frequency_ghz", config.frequency_ghz);
    read_value(p1812, "P1812", "time_percentage", config.time_percentage);
    read_value(p1812, "P1812", "polarization", config.polarization);

    const json& grid = require_section(document_, "RECEIVER_GENERATION");
    read_value(grid, "RECEIVER_GENERATION", "layout", config.receiver_layout);
    read_value(grid, "RECEIVER_GENERATION", "max_distance_km", config.max_distance_km);
    read_value(grid, "RECEIVER_GENERATION", "azimuth_step", config.azimuth_step_deg);
    read_value(grid, "RECEIVER_GENERATION", "distance_step", config.distance_step_km);
    read_value(grid, "RECEIVER_GENERATION", "sampling_resolution", config.sampling_resolution_m);
    read_value(grid, "RECEIVER_GENERATION", "include_tx_point", config.include_tx_point);
    read_value(grid, "RECEIVER_GENERATION", "num_points", config.num_points);
    read_value(grid, "RECEIVER_GENERATION", "scale_m", config.layout_scale_m);

    const json& data = require_section(document_, "DATA");
    read_value(data, "DATA", "elevation_raster", config.elevation_raster);
    read_value(data, "DATA", "landcover_raster", config.landcover_raster);
    read_value(data, "DATA", "zone_layer", config.zone_layer);
    read_value(data, "DATA", "zone_id_field", config.zone_id_field);
    read_value(data, "DATA", "expected_zone_ids", config.expected_zone_ids);
    if (data.contains("points_file") && data["points_file"].is_string() &&
        !data["points_file"].get<std::string>().empty()) {
        config.points_file = data["points_file"].get<std::string>();
    }

    const json& extraction = require_section(document_, "EXTRACTION");
    read_value(extraction, "EXTRACTION", "elevation_sentinel", config.elevation_sentinel);
    read_value(extraction, "EXTRACTION", "landcover_sentinel", config.landcover_sentinel);
    read_value(extraction, "EXTRACTION", "default_category", config.mappings.default_category);
    read_value(extraction, "EXTRACTION", "default_resistance", config.mappings.default_resistance);
    read_value(extraction, "EXTRACTION", "parallel_processing", config.parallel_processing);

    for (const auto& [key, value] : require_section(document_, "LCM10_TO_CT").items()) {
        if (!value.is_number_integer()) {
            throw ConfigurationError("LCM10_TO_CT value for '" + key + "' must be an integer");
        }
        config.mappings.class_to_category[parse_mapping_key(key, "LCM10_TO_CT")] = value.get<int>();
    }

    for (const auto& [key, value] : require_section(document_, "CT_TO_R").items()) {
        if (!value.is_number()) {
            throw ConfigurationError("CT_TO_R value for '" + key + "' must be a number");
        }
        config.mappings.category_to_resistance[parse_mapping_key(key, "CT_TO_R")] = value.get<double>();
    }

    const json& output = require_section(document_, "OUTPUT");
    read_value(output, "OUTPUT", "directory", config.output_directory);
    read_value(output, "OUTPUT", "base_name", config.base_name);
    if (output.contains("formats")) {
        const json& formats = output["formats"];
        if (formats.is_string()) {
            config.output_formats = {formats.get<std::string>()};
        } else {
            read_value(output, "OUTPUT", "formats", config.output_formats);
        }
    }

    return config;
}

void ConfigurationManager::from_enrichment_config(const EnrichmentConfig& config) {
    document_ = default_config();

    document_["TRANSMITTER"] = {
        {"tx_id", config.tx_id},
        {"longitude", config.tx_longitude},
        {"latitude", config.tx_latitude},
        {"antenna_height_tx", config.antenna_height_tx},
        {"antenna_height_rx", config.antenna_height_rx}
    };
    document_["P1812"] = {
        {"frequency_ghz", config.frequency_ghz},
        {"time_percentage", config.time_percentage},
        {"polarization", config.polarization}
    };
    document_["RECEIVER_GENERATION"] = {
        {"layout", config.receiver_layout},
        {"max_distance_km", config.max_distance_km},
        {"azimuth_step", config.azimuth_step_deg},
        {"distance_step", config.distance_step_km},
        {"sampling_resolution", config.sampling_resolution_m},
        {"include_tx_point", config.include_tx_point},
        {"num_points", config.num_points},
        {"scale_m", config.layout_scale_m}
    };
    document_["DATA"] = {
        {"elevation_raster", config.elevation_raster},
        {"landcover_raster", config.landcover_raster},
        {"zone_layer", config.zone_layer},
        {"zone_id_field", config.zone_id_field},
        {"expected_zone_ids", config.expected_zone_ids},
        {"points_file", config.points_file ? json(*config.points_file) : json(nullptr)}
    };
    document_["EXTRACTION"] = {
        {"elevation_sentinel", config.elevation_sentinel},
        {"landcover_sentinel", config.landcover_sentinel},
        {"default_category", config.mappings.default_category},
        {"default_resistance", config.mappings.default_resistance},
        {"parallel_processing", config.parallel_processing}
    };

    json lcm10_to_ct = json::object();
    for (const auto& [raw_class, category] : config.mappings.class_to_category) {
        lcm10_to_ct[std::to_string(raw_class)] = category;
    }
    document_["LCM10_TO_CT"] = lcm10_to_ct;

    json ct_to_r = json::object();
    for (const auto& [category, resistance] : config.mappings.category_to_resistance) {
        ct_to_r[std::to_string(category)] = resistance;
    }
    document_["CT_TO_R"] = ct_to_r;

    document_["OUTPUT"] = {
        {"directory", config.output_directory},
        {"base_name", config.base_name},
        {"formats", config.output_formats}
    };
}

} // namespace rxgis
