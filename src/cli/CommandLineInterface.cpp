/**
 * @file CommandLineInterface.cpp
 * @brief Command line interface implementation
 */

#include "CommandLineInterface.hpp"
#include "ConfigurationManager.hpp"
#include "ExtractionErrors.hpp"
#include "../core/ConfigValidator.hpp"
#include "../core/Logger.hpp"
#include "version.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

namespace rxgis {

void CommandLineInterface::register_options(SimpleCommandLineParser& parser) const {
    parser.add_section("CONFIGURATION");
    parser.add_option("config", "c", "Path to JSON configuration file");
    parser.add_option("create-config", "", "Write the default configuration to the given path and exit");

    parser.add_section("DATA SOURCES");
    parser.add_option("elevation", "e", "Elevation raster (any GDAL-readable file)");
    parser.add_option("landcover", "l", "Land-cover class raster (any GDAL-readable file)");
    parser.add_option("zones", "z", "Zone polygon layer (any OGR-readable source)");
    parser.add_option("zone-field", "", "Integer zone id attribute (config default: zone_type_id)");
    parser.add_option("points", "p", "Read receivers from a point layer instead of generating a grid");

    parser.add_section("RECEIVER GRID");
    parser.add_option("transmitter", "t", "Transmitter position as lat,lon in decimal degrees");
    parser.add_option("layout", "", "Receiver layout: radial (profile grid) or phyllotaxis (spiral)");
    parser.add_option("max-distance", "", "Maximum receiver distance in km");
    parser.add_option("azimuth-step", "", "Angle between radials in degrees");
    parser.add_option("distance-step", "", "Distance between receivers along a radial in km");
    parser.add_option("num-points", "n", "Number of phyllotaxis receivers");
    parser.add_option("layout-scale", "", "Phyllotaxis outer radius in meters (default: 1000)");

    parser.add_section("OUTPUT");
    parser.add_option("output-dir", "o", "Output directory");
    parser.add_option("base-name", "", "Output filename prefix");
    parser.add_option("output-formats", "f", "Comma-separated formats: csv, geojson, profiles");

    parser.add_section("PROCESSING & LOGGING");
    parser.add_flag("sequential", "", "Run the extraction pipelines one after another");
    parser.add_option("log-level", "", "1=ERROR, 2=WARNING, 3=INFO, 4=DETAILED, 5=DEBUG, 6=TRACE; "
                                       "facility levels as \"3,ZoneResolver=6\"");
    parser.add_option("log-file", "", "Log to file (append if exists)");
    parser.add_flag("verbose", "v", "Enable verbose logging (same as --log-level 6)");
    parser.add_flag("silent", "s", "Only report errors (same as --log-level 1)");
    parser.add_flag("dry-run", "", "Parse arguments and validate without processing");
    parser.add_flag("version", "", "Show version information");
}

bool CommandLineInterface::parse_arguments(int argc, char* argv[]) {
    SimpleCommandLineParser parser("rx-enrich",
        "Enrich radio receiver points with elevation, land-cover resistance and zone id\n"
        "\n"
        "Receivers are generated as a radial grid around the transmitter, or read\n"
        "from a point layer, then sampled against preloaded GDAL rasters and an OGR\n"
        "zone layer. Results are written as CSV, GeoJSON and P.1812 path profiles.\n"
        "\n"
        "Examples:\n"
        "  rx-enrich --create-config site.json\n"
        "  rx-enrich --config site.json\n"
        "  rx-enrich --elevation dem.tif --landcover worldcover.tif --zones zones.gpkg \\\n"
        "            --transmitter 9.345,-13.40694 --output-formats csv,profiles");
    register_options(parser);

    // Defaults include the WorldCover mapping tables
    config_ = ConfigurationManager().to_enrichment_config();
    dry_run_ = false;

    if (!parser.parse(argc, argv)) {
        exit_code_ = parser.help_requested() ? 0 : 1;
        return false;
    }

    if (!parser.get_positional().empty()) {
        std::cerr << "Unexpected argument: " << parser.get_positional().front() << std::endl;
        exit_code_ = 1;
        return false;
    }

    if (parser.get_flag("version")) {
        std::cout << "rx-enrich v" << RXGIS_VERSION_STRING << std::endl;
        std::cout << "Receiver point enrichment built with GDAL, GEOS, Eigen, nlohmann_json";
#ifdef HAVE_TBB
        std::cout << ", TBB";
#endif
        std::cout << std::endl;
        exit_code_ = 0;
        return false;
    }

    if (auto config_path = parser.get("create-config")) {
        if (!create_default_config_file(config_path.value())) {
            std::cerr << "Failed to create configuration file: " << config_path.value() << std::endl;
            exit_code_ = 1;
        } else {
            std::cout << "Created default configuration file: " << config_path.value() << std::endl;
            exit_code_ = 0;
        }
        return false;
    }

    if (auto config_file = parser.get("config")) {
        if (!load_config_file(config_file.value())) {
            exit_code_ = 1;
            return false;
        }
        config_.config_file = config_file.value();
    }

    if (!apply_options(parser)) {
        exit_code_ = 1;
        return false;
    }
    configure_logging(parser);

    dry_run_ = parser.get_flag("dry-run");

    ConfigValidator validator;
    ValidationResult validation = validator.validate(config_);
    if (validation.has_errors()) {
        std::cerr << validation.format_error_message() << std::endl;
        exit_code_ = 1;
        return false;
    }

    return true;
}

bool CommandLineInterface::apply_options(const SimpleCommandLineParser& parser) {
    // Data sources
    if (auto value = parser.get("elevation")) config_.elevation_raster = value.value();
    if (auto value = parser.get("landcover")) config_.landcover_raster = value.value();
    if (auto value = parser.get("zones")) config_.zone_layer = value.value();
    if (auto value = parser.get("zone-field")) config_.zone_id_field = value.value();
    if (auto value = parser.get("points")) config_.points_file = value.value();

    // Receiver grid
    if (auto value = parser.get("transmitter")) {
        if (!parse_lat_lon(value.value(), config_.tx_latitude, config_.tx_longitude)) {
            std::cerr << "Invalid transmitter position '" << value.value() << "'. Use: lat,lon" << std::endl;
            return false;
        }
    }

    if (auto value = parser.get("layout")) config_.receiver_layout = value.value();

    struct NumericOption {
        const char* name;
        double& target;
    };
    for (const NumericOption& option : {NumericOption{"max-distance", config_.max_distance_km},
                                        NumericOption{"azimuth-step", config_.azimuth_step_deg},
                                        NumericOption{"distance-step", config_.distance_step_km},
                                        NumericOption{"layout-scale", config_.layout_scale_m}}) {
        if (parser.get(option.name)) {
            auto parsed = parser.get_as<double>(option.name);
            if (!parsed) {
                std::cerr << "Option --" << option.name << " expects a number" << std::endl;
                return false;
            }
            option.target = parsed.value();
        }
    }

    if (parser.get("num-points")) {
        auto parsed = parser.get_as<int>("num-points");
        if (!parsed) {
            std::cerr << "Option --num-points expects an integer" << std::endl;
            return false;
        }
        config_.num_points = parsed.value();
    }

    // Output
    if (auto value = parser.get("output-dir")) {
        std::string path = value.value();
        if (path.size() > 1 && path.back() == '/') {
            path.pop_back();
        }
        config_.output_directory = path;
    }
    if (auto value = parser.get("base-name")) config_.base_name = value.value();
    if (auto value = parser.get("output-formats")) config_.output_formats = parse_formats(value.value());

    if (parser.get_flag("sequential")) {
        config_.parallel_processing = false;
    }

    return true;
}

void CommandLineInterface::configure_logging(const SimpleCommandLineParser& parser) {
    if (parser.get_flag("silent")) {
        config_.log_level = 1;
        config_.log_config.clear();
    } else if (parser.get_flag("verbose")) {
        config_.log_level = 6;
        config_.log_config.clear();
    } else if (auto value = parser.get("log-level")) {
        config_.log_config = value.value();
        auto level = parser.get_as<int>("log-level");
        if (level) {
            config_.log_level = std::max(1, std::min(6, level.value()));
        }
    }

    if (auto value = parser.get("log-file")) {
        config_.log_file = value.value();
    }

    Logger::clearFacilityLevels();
    Logger::setDefaultLevel(static_cast<LogLevel>(config_.log_level));
    if (!config_.log_config.empty()) {
        Logger::parseLogConfig(config_.log_config);
    }
}

bool CommandLineInterface::parse_lat_lon(const std::string& text, double& lat, double& lon) {
    const size_t comma = text.find(',');
    if (comma == std::string::npos) {
        return false;
    }

    try {
        size_t lat_end = 0;
        size_t lon_end = 0;
        const std::string lat_text = text.substr(0, comma);
        const std::string lon_text = text.substr(comma + 1);
        const double parsed_lat = std::stod(lat_text, &lat_end);
        const double parsed_lon = std::stod(lon_text, &lon_end);

        if (lat_text.find_first_not_of(" \t", lat_end) != std::string::npos ||
            lon_text.find_first_not_of(" \t", lon_end) != std::string::npos ||
            !std::isfinite(parsed_lat) || !std::isfinite(parsed_lon)) {
            return false;
        }

        lat = parsed_lat;
        lon = parsed_lon;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::vector<std::string> CommandLineInterface::parse_formats(const std::string& formats_str) {
    std::vector<std::string> formats;
    std::istringstream iss(formats_str);
    std::string format;

    while (std::getline(iss, format, ',')) {
        // Trim whitespace
        format.erase(0, format.find_first_not_of(" \t"));
        format.erase(format.find_last_not_of(" \t") + 1);

        if (!format.empty()) {
            formats.push_back(format);
        }
    }

    return formats;
}

bool CommandLineInterface::create_default_config_file(const std::string& filename) const {
    ConfigurationManager manager;
    return manager.save_to_file(filename);
}

bool CommandLineInterface::load_config_file(const std::string& filename) {
    try {
        ConfigurationManager manager;
        if (!manager.load_from_file(filename)) {
            std::cerr << "Error: Could not open config file: " << filename << std::endl;
            return false;
        }
        config_ = manager.to_enrichment_config();
        return true;
    } catch (const ConfigurationError& e) {
        std::cerr << "Error loading config file: " << e.what() << std::endl;
        return false;
    }
}

void CommandLineInterface::print_config() const {
    std::cout << "\n=== rx-enrich Configuration ===\n";
    std::cout << "Transmitter: " << config_.tx_id << " at (" << config_.tx_latitude << ", "
              << config_.tx_longitude << "), htg " << config_.antenna_height_tx << " m, hrg "
              << config_.antenna_height_rx << " m\n";
    std::cout << "P.1812: f " << config_.frequency_ghz << " GHz, p " << config_.time_percentage
              << "%, polarization " << (config_.polarization == 1 ? "horizontal" : "vertical") << "\n";

    if (config_.points_file) {
        std::cout << "Receivers: " << *config_.points_file << "\n";
    } else if (config_.receiver_layout == "phyllotaxis") {
        std::cout << "Receivers: phyllotaxis spiral of " << config_.num_points << " points within "
                  << config_.layout_scale_m << " m\n";
    } else {
        std::cout << "Receivers: radial grid to " << config_.max_distance_km << " km, every "
                  << config_.azimuth_step_deg << " deg and " << config_.distance_step_km << " km\n";
    }

    auto show = [](const std::string& path) { return path.empty() ? std::string("(none)") : path; };
    std::cout << "Elevation raster: " << show(config_.elevation_raster) << "\n";
    std::cout << "Land-cover raster: " << show(config_.landcover_raster) << "\n";
    std::cout << "Zone layer: " << show(config_.zone_layer) << " [" << config_.zone_id_field << "]\n";
    std::cout << "Mappings: " << config_.mappings.class_to_category.size() << " classes, "
              << config_.mappings.category_to_resistance.size() << " categories, defaults Ct="
              << config_.mappings.default_category << " R=" << config_.mappings.default_resistance << "\n";
    std::cout << "Parallel processing: " << (config_.parallel_processing ? "enabled" : "disabled") << "\n";

    std::cout << "Output formats: ";
    for (size_t i = 0; i < config_.output_formats.size(); ++i) {
        std::cout << config_.output_formats[i];
        if (i < config_.output_formats.size() - 1) std::cout << ", ";
    }
    std::cout << "\n";
    std::cout << "Output directory: " << config_.output_directory << "\n";
    std::cout << "Base filename: " << config_.base_name << "\n";
    std::cout << "===============================\n\n";
}

} // namespace rxgis
