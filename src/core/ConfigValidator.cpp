/**
 * @file ConfigValidator.cpp
 * @brief Implementation of configuration validation
 */

#include "ConfigValidator.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace rxgis {

namespace {

constexpr double MIN_FREQUENCY_GHZ = 0.03;
constexpr double MAX_FREQUENCY_GHZ = 6.0;
constexpr double MIN_TIME_PERCENTAGE = 1.0;
constexpr double MAX_TIME_PERCENTAGE = 50.0;

std::string format_number(double value) {
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

} // anonymous namespace

const std::vector<std::string>& supported_output_formats() {
    static const std::vector<std::string> formats = {
        "csv",       // CSVExporter - one row per receiver
        "geojson",   // GeoJSONExporter - point FeatureCollection
        "profiles"   // ProfileExporter - P.1812 path profiles
    };
    return formats;
}

std::string ValidationResult::format_error_message() const {
    if (is_valid || conflicts.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << "\nERROR: Invalid configuration:\n\n";

    for (size_t i = 0; i < conflicts.size(); ++i) {
        const auto& conflict = conflicts[i];

        oss << "Problem " << (i + 1) << ": " << conflict.description << "\n";

        if (!conflict.involved_params.empty()) {
            oss << "  Involved parameters:\n";
            for (const auto& param : conflict.involved_params) {
                oss << "    " << param << "\n";
            }
        }

        if (!conflict.suggestions.empty()) {
            oss << "  Suggested solutions:\n";
            for (size_t j = 0; j < conflict.suggestions.size(); ++j) {
                oss << "    " << (j + 1) << ". " << conflict.suggestions[j] << "\n";
            }
        }

        if (i < conflicts.size() - 1) {
            oss << "\n";
        }
    }

    return oss.str();
}

ValidationResult ConfigValidator::validate(const EnrichmentConfig& config) const {
    ValidationResult result;

    for (auto check : {&ConfigValidator::check_transmitter,
                       &ConfigValidator::check_p1812_parameters,
                       &ConfigValidator::check_receiver_grid,
                       &ConfigValidator::check_data_sources,
                       &ConfigValidator::check_output_formats}) {
        if (auto conflict = (this->*check)(config)) {
            result.conflicts.push_back(*conflict);
            result.is_valid = false;
        }
    }

    return result;
}

std::optional<ParameterConflict> ConfigValidator::check_transmitter(const EnrichmentConfig& config) const {
    const bool lat_ok = std::isfinite(config.tx_latitude) && std::abs(config.tx_latitude) <= 90.0;
    const bool lon_ok = std::isfinite(config.tx_longitude) && std::abs(config.tx_longitude) <= 180.0;
    if (lat_ok && lon_ok) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Transmitter position is not a valid WGS84 coordinate";
    conflict.involved_params = {
        "TRANSMITTER.latitude " + format_number(config.tx_latitude),
        "TRANSMITTER.longitude " + format_number(config.tx_longitude)
    };
    conflict.suggestions = {
        "Use --transmitter lat,lon with latitude in [-90, 90] and longitude in [-180, 180]"
    };
    return conflict;
}

std::optional<ParameterConflict> ConfigValidator::check_p1812_parameters(const EnrichmentConfig& config) const {
    ParameterConflict conflict;
    conflict.description = "P.1812 parameters outside their valid range";

    if (!(config.frequency_ghz >= MIN_FREQUENCY_GHZ && config.frequency_ghz <= MAX_FREQUENCY_GHZ)) {
        conflict.involved_params.push_back("P1812.frequency_ghz " + format_number(config.frequency_ghz));
        conflict.suggestions.push_back("Set frequency_ghz between 0.03 and 6");
    }
    if (!(config.time_percentage >= MIN_TIME_PERCENTAGE && config.time_percentage <= MAX_TIME_PERCENTAGE)) {
        conflict.involved_params.push_back("P1812.time_percentage " + format_number(config.time_percentage));
        conflict.suggestions.push_back("Set time_percentage between 1 and 50");
    }
    if (config.polarization != 1 && config.polarization != 2) {
        conflict.involved_params.push_back("P1812.polarization " + std::to_string(config.polarization));
        conflict.suggestions.push_back("Use polarization 1 (horizontal) or 2 (vertical)");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    return conflict;
}

std::optional<ParameterConflict> ConfigValidator::check_receiver_grid(const EnrichmentConfig& config) const {
    // Grid parameters only matter when receivers are generated
    if (config.points_file) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "Receiver grid cannot be generated";

    if (config.receiver_layout == "phyllotaxis") {
        if (config.num_points <= 0) {
            conflict.involved_params.push_back("--num-points " + std::to_string(config.num_points));
            conflict.suggestions.push_back("Use at least one point, e.g. --num-points 500");
        }
        if (!(config.layout_scale_m > 0.0)) {
            conflict.involved_params.push_back("--layout-scale " + format_number(config.layout_scale_m) + " m");
            conflict.suggestions.push_back("Use a positive radius, e.g. --layout-scale 1000");
        }
        if (conflict.involved_params.empty()) {
            return std::nullopt;
        }
        return conflict;
    }

    if (config.receiver_layout != "radial") {
        conflict.involved_params.push_back("RECEIVER_GENERATION.layout \"" + config.receiver_layout + "\"");
        conflict.suggestions.push_back("Use --layout radial or --layout phyllotaxis");
        return conflict;
    }

    if (!(config.distance_step_km > 0.0)) {
        conflict.involved_params.push_back("--distance-step " + format_number(config.distance_step_km) + " km");
        conflict.suggestions.push_back("Use a positive distance step, e.g. --distance-step 0.03");
    }
    if (!(config.max_distance_km > 0.0)) {
        conflict.involved_params.push_back("--max-distance " + format_number(config.max_distance_km) + " km");
        conflict.suggestions.push_back("Use a positive maximum distance, e.g. --max-distance 11");
    } else if (config.distance_step_km > config.max_distance_km) {
        std::ostringstream calc;
        calc << std::fixed << std::setprecision(3)
             << "Calculation: step " << config.distance_step_km << " km > maximum "
             << config.max_distance_km << " km leaves no rings";
        conflict.involved_params.push_back(calc.str());
        conflict.suggestions.push_back("Use --distance-step " + format_number(config.max_distance_km) +
                                       " or smaller");
    }
    if (!(config.azimuth_step_deg > 0.0 && config.azimuth_step_deg <= 360.0)) {
        conflict.involved_params.push_back("--azimuth-step " + format_number(config.azimuth_step_deg) + " deg");
        conflict.suggestions.push_back("Use an azimuth step in (0, 360], e.g. --azimuth-step 10");
    }

    if (conflict.involved_params.empty()) {
        return std::nullopt;
    }
    return conflict;
}

std::optional<ParameterConflict> ConfigValidator::check_data_sources(const EnrichmentConfig& config) const {
    if (!config.elevation_raster.empty() || !config.landcover_raster.empty() || !config.zone_layer.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = "No data source configured, nothing to extract";
    conflict.involved_params = {"DATA.elevation_raster", "DATA.landcover_raster", "DATA.zone_layer"};
    conflict.suggestions = {
        "Use --elevation <raster>",
        "Use --landcover <raster>",
        "Use --zones <layer> with --zone-field <field>"
    };
    return conflict;
}

std::optional<ParameterConflict> ConfigValidator::check_output_formats(const EnrichmentConfig& config) const {
    const auto& supported = supported_output_formats();

    std::vector<std::string> unsupported;
    for (const auto& format : config.output_formats) {
        if (std::find(supported.begin(), supported.end(), format) == supported.end()) {
            unsupported.push_back(format);
        }
    }

    if (unsupported.empty() && !config.output_formats.empty()) {
        return std::nullopt;
    }

    ParameterConflict conflict;
    conflict.description = config.output_formats.empty() ? "No output format requested"
                                                         : "Unsupported output format";
    for (const auto& format : unsupported) {
        conflict.involved_params.push_back("'" + format + "'");
    }
    conflict.suggestions = {"Use --output-formats with any of: csv, geojson, profiles"};
    return conflict;
}

} // namespace rxgis
