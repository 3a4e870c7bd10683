/**
 * @file ConfigurationManager.cpp
 * @brief Configuration management for the export tool
 */

#include "ConfigurationManager.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace qreport {

using json = nlohmann::json;

namespace {

// Keys whose values are written back as JSON numbers or booleans
const std::vector<std::string> INTEGER_KEYS = {
    "photo_max_width", "max_photos_per_module", "large_export_threshold_mb", "cleanup_older_than_days"
};
const std::vector<std::string> BOOLEAN_KEYS = {
    "include_photos", "include_notes", "generate_photo_index", "timestamped_directory", "write_manifest"
};

bool contains(const std::vector<std::string>& keys, const std::string& key) {
    for (const auto& k : keys) {
        if (k == key) return true;
    }
    return false;
}

} // namespace

int ConfigurationManager::get_int(const std::string& key, int default_value) const {
    auto it = config_values_.find(key);
    if (it != config_values_.end()) {
        try {
            return std::stoi(it->second);
        } catch (const std::invalid_argument&) {
            std::cerr << "Warning: '" << key << "' is not a number, using " << default_value << std::endl;
        } catch (const std::out_of_range&) {
            std::cerr << "Warning: '" << key << "' is out of range, using " << default_value << std::endl;
        }
    }
    return default_value;
}

bool ConfigurationManager::get_bool(const std::string& key, bool default_value) const {
    auto it = config_values_.find(key);
    if (it != config_values_.end()) {
        const std::string& value = it->second;
        return value == "true" || value == "1" || value == "yes";
    }
    return default_value;
}

bool ConfigurationManager::load_from_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Cannot open config file: " << filename << std::endl;
        return false;
    }

    try {
        json config;
        file >> config;

        if (!config.is_object()) {
            std::cerr << "Config file must contain a JSON object: " << filename << std::endl;
            return false;
        }

        for (auto it = config.begin(); it != config.end(); ++it) {
            const json& value = it.value();
            if (value.is_string()) {
                config_values_[it.key()] = value.get<std::string>();
            } else if (value.is_boolean()) {
                config_values_[it.key()] = value.get<bool>() ? "true" : "false";
            } else if (value.is_number_integer()) {
                config_values_[it.key()] = std::to_string(value.get<long long>());
            } else if (value.is_array()) {
                // ["document", "text"] is accepted as well as "document,text"
                std::string joined;
                for (const auto& element : value) {
                    if (!joined.empty()) joined += ",";
                    joined += element.get<std::string>();
                }
                config_values_[it.key()] = joined;
            } else {
                config_values_[it.key()] = value.dump();
            }
        }

        return true;

    } catch (const json::exception& e) {
        std::cerr << "Error parsing JSON config file: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigurationManager::save_to_file(const std::string& filename) const {
    std::ofstream file(filename);
    if (!file.is_open()) {
        return false;
    }

    json config = json::object();
    for (const auto& [key, value] : config_values_) {
        if (contains(BOOLEAN_KEYS, key)) {
            config[key] = (value == "true" || value == "1" || value == "yes");
        } else if (contains(INTEGER_KEYS, key)) {
            config[key] = get_int(key);
        } else {
            config[key] = value;
        }
    }

    file << config.dump(2) << std::endl;
    return static_cast<bool>(file);
}

ConfigurationManager ConfigurationManager::defaults() {
    ConfigurationManager manager;
    ExportOptions options;
    options.formats = {ExportFormat::DOCUMENT, ExportFormat::TEXT};
    manager.from_export_options(options);
    manager.set_value("exports_root", "exports");
    manager.set_value("large_export_threshold_mb", "100");
    manager.set_value("cleanup_older_than_days", "30");
    manager.set_value("log_level", "3");
    return manager;
}

std::vector<ExportFormat> ConfigurationManager::parse_formats(const std::string& formats,
                                                              std::vector<std::string>* unknown) {
    std::vector<ExportFormat> parsed;
    std::istringstream iss(formats);
    std::string token;

    while (std::getline(iss, token, ',')) {
        token.erase(0, token.find_first_not_of(" \t"));
        token.erase(token.find_last_not_of(" \t") + 1);
        if (token.empty()) continue;

        auto format = parse_export_format(token);
        if (!format) {
            if (unknown) unknown->push_back(token);
            continue;
        }

        bool seen = false;
        for (auto f : parsed) {
            if (f == *format) seen = true;
        }
        if (!seen) parsed.push_back(*format);
    }

    return parsed;
}

std::string ConfigurationManager::join_formats(const std::vector<ExportFormat>& formats) {
    std::string joined;
    for (auto format : formats) {
        if (!joined.empty()) joined += ",";
        joined += to_string(format);
    }
    return joined;
}

ExportOptions ConfigurationManager::to_export_options() const {
    ExportOptions options;

    if (has_value("formats")) {
        options.formats = parse_formats(get_string("formats"));
    } else {
        options.formats = {ExportFormat::DOCUMENT, ExportFormat::TEXT};
    }

    if (auto strategy = parse_naming_strategy(get_string("naming_strategy"))) {
        options.naming_strategy = *strategy;
    }
    if (auto quality = parse_photo_quality(get_string("photo_quality"))) {
        options.photo_quality = *quality;
    }

    options.photo_max_width = get_int("photo_max_width", options.photo_max_width);
    options.include_photos = get_bool("include_photos", options.include_photos);
    options.include_notes = get_bool("include_notes", options.include_notes);
    options.generate_photo_index = get_bool("generate_photo_index", options.generate_photo_index);
    options.create_timestamped_directory = get_bool("timestamped_directory", options.create_timestamped_directory);
    options.max_photos_per_module = get_int("max_photos_per_module", options.max_photos_per_module);
    options.write_manifest = get_bool("write_manifest", options.write_manifest);

    return options;
}

void ConfigurationManager::from_export_options(const ExportOptions& options) {
    set_value("formats", join_formats(options.formats));
    set_value("naming_strategy", to_string(options.naming_strategy));
    set_value("photo_quality", to_string(options.photo_quality));
    set_value("photo_max_width", std::to_string(options.photo_max_width));
    set_value("include_photos", options.include_photos ? "true" : "false");
    set_value("include_notes", options.include_notes ? "true" : "false");
    set_value("generate_photo_index", options.generate_photo_index ? "true" : "false");
    set_value("timestamped_directory", options.create_timestamped_directory ? "true" : "false");
    set_value("max_photos_per_module", std::to_string(options.max_photos_per_module));
    set_value("write_manifest", options.write_manifest ? "true" : "false");
}

} // namespace qreport
