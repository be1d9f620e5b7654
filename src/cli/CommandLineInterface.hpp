/**
 * @file CommandLineInterface.hpp
 * @brief Command line interface for the rx-enrich tool
 */

#pragma once

#include "rx_point_enricher.hpp"
#include "SimpleCommandLineParser.hpp"
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief Parses arguments into an EnrichmentConfig
 *
 * Precedence: built-in defaults, then the --config file, then individual
 * command line options.
 */
class CommandLineInterface {
public:
    CommandLineInterface() = default;

    /**
     * @brief Parse command line arguments
     * @param argc Argument count
     * @param argv Argument vector
     * @return true if the run should proceed; otherwise check exit_code()
     */
    bool parse_arguments(int argc, char* argv[]);

    const EnrichmentConfig& get_config() const { return config_; }

    bool is_dry_run() const { return dry_run_; }

    /**
     * @brief Process exit code when parse_arguments() returned false
     *
     * 0 after --help, --version or --create-config, 1 on invalid input.
     */
    int exit_code() const { return exit_code_; }

    /**
     * @brief Print the current configuration
     */
    void print_config() const;

    /**
     * @brief Parse "lat,lon" in decimal degrees
     * @return false if the string is not two finite numbers
     */
    static bool parse_lat_lon(const std::string& text, double& lat, double& lon);

    static std::vector<std::string> parse_formats(const std::string& formats_str);

private:
    EnrichmentConfig config_;
    bool dry_run_ = false;
    int exit_code_ = 0;

    void register_options(SimpleCommandLineParser& parser) const;
    bool apply_options(const SimpleCommandLineParser& parser);
    void configure_logging(const SimpleCommandLineParser& parser);

    bool create_default_config_file(const std::string& filename) const;
    bool load_config_file(const std::string& filename);
};

} // namespace rxgis
