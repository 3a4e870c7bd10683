/**
 * @file ConfigurationManager.hpp
 * @brief JSON configuration file for the export tool
 */

#pragma once

#include "qreport_export.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace qreport {

/**
 * @brief Flat key/value settings loaded from and saved to a JSON object
 *
 * Keys: exports_root, formats ("document,text"), naming_strategy,
 * photo_quality, photo_max_width, include_photos, include_notes,
 * generate_photo_index, timestamped_directory, max_photos_per_module,
 * write_manifest, large_export_threshold_mb, cleanup_older_than_days,
 * log_level.
 */
class ConfigurationManager {
public:
    ConfigurationManager() = default;

    /**
     * @brief Load a JSON object of scalar settings
     * @return true if successful, false otherwise (reason on stderr)
     */
    bool load_from_file(const std::string& filename);

    /**
     * @brief Save the current settings as a JSON object
     * @return true if successful, false otherwise
     */
    bool save_to_file(const std::string& filename) const;

    /**
     * @brief Settings of a freshly created configuration file
     */
    static ConfigurationManager defaults();

    /**
     * @brief Build export options, starting from ExportOptions defaults
     */
    ExportOptions to_export_options() const;

    void from_export_options(const ExportOptions& options);

    /**
     * @brief Parse "document,text,photos" into formats
     * @param unknown Receives the tokens that are not format names
     */
    static std::vector<ExportFormat> parse_formats(const std::string& formats,
                                                   std::vector<std::string>* unknown = nullptr);

    static std::string join_formats(const std::vector<ExportFormat>& formats);

    std::string exports_root() const { return get_string("exports_root", "exports"); }

    // Value setters and getters
    void set_value(const std::string& key, const std::string& value) {
        config_values_[key] = value;
    }

    bool has_value(const std::string& key) const {
        return config_values_.find(key) != config_values_.end();
    }

    std::string get_string(const std::string& key, const std::string& default_value = "") const {
        auto it = config_values_.find(key);
        return (it != config_values_.end()) ? it->second : default_value;
    }

    int get_int(const std::string& key, int default_value = 0) const;
    bool get_bool(const std::string& key, bool default_value = false) const;

private:
    std::map<std::string, std::string> config_values_;
};

} // namespace qreport
