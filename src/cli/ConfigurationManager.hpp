/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration management for the enrichment pipeline
 */

#pragma once

#include "rx_point_enricher.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace rxgis {

/**
 * @brief Sectioned JSON configuration with built-in defaults
 *
 * Sections: TRANSMITTER, P1812, RECEIVER_GENERATION, DATA, EXTRACTION,
 * LCM10_TO_CT, CT_TO_R, OUTPUT. A user file is deep-merged over the
 * defaults, so it only needs the keys it changes.
 */
class ConfigurationManager {
public:
    ConfigurationManager();

    /**
     * @brief Built-in default document
     */
    static nlohmann::json default_config();

    /**
     * @brief Deep-merge a JSON configuration file over the current document
     * @return false if the file cannot be opened
     * @throws ConfigurationError if the file is not valid JSON or not an object
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Deep-merge an in-memory document over the current one
     * @throws ConfigurationError if overrides is not an object
     */
    void merge(const nlohmann::json& overrides);

    /**
     * @brief Write the current document as indented JSON
     * @return true if successful
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Convert to EnrichmentConfig
     * @throws ConfigurationError on missing sections, wrong value types or
     *         non-integer mapping keys
     */
    EnrichmentConfig to_enrichment_config() const;

    /**
     * @brief Replace the document with the values of an EnrichmentConfig
     */
    void from_enrichment_config(const EnrichmentConfig& config);

    const nlohmann::json& document() const { return document_; }

    // Section/key access
    bool has_value(const std::string& section, const std::string& key) const {
        return document_.contains(section) && document_[section].is_object() &&
               document_[section].contains(key);
    }

    void set_value(const std::string& section, const std::string& key, const nlohmann::json& value) {
        document_[section][key] = value;
    }

    template<typename T>
    T get_value(const std::string& section, const std::string& key, const T& default_value) const {
        if (!has_value(section, key) || document_[section][key].is_null()) {
            return default_value;
        }
        try {
            return document_[section][key].get<T>();
        } catch (const nlohmann::json::exception&) {
            return default_value;
        }
    }

private:
    nlohmann::json document_;
};

} // namespace rxgis
