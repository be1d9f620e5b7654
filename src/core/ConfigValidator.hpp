/**
 * @file ConfigValidator.hpp
 * @brief Validation of enrichment run parameters
 *
 * Checks a run configuration for out-of-range or contradictory values and
 * reports each problem with the parameters involved and suggested fixes.
 */

#pragma once

#include "rx_point_enricher.hpp"
#include <optional>
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief Represents a parameter conflict detected in a configuration
 */
struct ParameterConflict {
    std::string description;                   // Description of the conflict
    std::vector<std::string> involved_params;  // Parameters involved
    std::vector<std::string> suggestions;      // Suggested resolutions
};

/**
 * @brief Result of configuration validation
 */
struct ValidationResult {
    bool is_valid;
    std::vector<ParameterConflict> conflicts;

    ValidationResult() : is_valid(true) {}

    bool has_errors() const { return !is_valid; }

    std::string format_error_message() const;
};

/**
 * @brief Output formats the exporters understand
 */
const std::vector<std::string>& supported_output_formats();

/**
 * @brief Validates run configuration values
 */
class ConfigValidator {
public:
    ConfigValidator() = default;

    /**
     * @brief Validate all configuration parameters
     * @param config Configuration to validate
     * @return Validation result with any conflicts found
     */
    ValidationResult validate(const EnrichmentConfig& config) const;

private:
    /**
     * @brief Transmitter coordinates must be valid WGS84 degrees
     */
    std::optional<ParameterConflict> check_transmitter(const EnrichmentConfig& config) const;

    /**
     * @brief Frequency in [0.03, 6] GHz, time percentage in [1, 50], polarization 1 or 2
     */
    std::optional<ParameterConflict> check_p1812_parameters(const EnrichmentConfig& config) const;

    /**
     * @brief Known layout; radial steps positive, azimuth step in (0, 360],
     *        step not beyond the maximum distance; phyllotaxis count and radius positive
     */
    std::optional<ParameterConflict> check_receiver_grid(const EnrichmentConfig& config) const;

    std::optional<ParameterConflict> check_data_sources(const EnrichmentConfig& config) const;

    std::optional<ParameterConflict> check_output_formats(const EnrichmentConfig& config) const;
};

} // namespace rxgis
