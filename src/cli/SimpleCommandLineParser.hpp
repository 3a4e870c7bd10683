/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the export tool
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <sstream>
#include <iostream>

namespace qreport {

/**
 * @brief Simple command-line argument parser
 * 
 * Long options (--name VALUE, --name=VALUE), short aliases and flags.
 * Unknown options and missing values are reported on stderr.
 */
class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool required;
        bool has_value;
        std::string default_value;
        
        // Default constructor for std::map
        Option() : required(false), has_value(true) {}
        
        Option(const std::string& long_name, const std::string& short_name,
               const std::string& description, bool required = false,
               bool has_value = true, const std::string& default_value = "")
            : long_name(long_name), short_name(short_name), description(description),
              required(required), has_value(has_value), default_value(default_value) {}
    };
    
    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {}
    
    // Add command line options
    void add_option(const std::string& long_name, const std::string& short_name,
                   const std::string& description, bool required = false,
                   const std::string& default_value = "") {
        options_[long_name] = Option(long_name, short_name, description, required, true, default_value);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }
    
    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        options_[long_name] = Option(long_name, short_name, description, false, false);
        if (!short_name.empty()) {
            short_to_long_[short_name] = long_name;
        }
    }
    
    // Parse command line arguments
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;
        
        // Store all arguments
        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }
        
        // Check for help request
        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                show_help();
                help_requested_ = true;
                return false;
            }
        }
        
        // Parse arguments
        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];
            
            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);
                
                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                }
                
                if (options_.find(option_name) == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }
                
                const auto& option = options_[option_name];
                if (option.has_value) {
                    if (value.empty()) {
                        if (i + 1 >= args_.size() || args_[i + 1].starts_with("-")) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }
                
            } else if (arg.starts_with("-") && arg.size() > 1) {
                std::string short_name = arg.substr(1);
                
                if (short_to_long_.find(short_name) == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }
                
                std::string option_name = short_to_long_[short_name];
                const auto& option = options_[option_name];
                
                if (option.has_value) {
                    if (i + 1 >= args_.size() || args_[i + 1].starts_with("-")) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                // Positional argument
                positional_args_.push_back(arg);
            }
        }
        
        // Check required options
        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }
        
        // Set default values
        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }
        
        return true;
    }
    
    // Get parsed values
    std::optional<std::string> get(const std::string& option_name) const {
        auto it = parsed_values_.find(option_name);
        if (it != parsed_values_.end()) {
            return it->second;
        }
        return std::nullopt;
    }
    
    bool get_flag(const std::string& option_name) const {
        auto value = get(option_name);
        return value.has_value() && value.value() == "true";
    }
    
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value.has_value()) {
            return std::nullopt;
        }
        
        std::istringstream iss(value.value());
        T result;
        if (iss >> result) {
            return result;
        }
        return std::nullopt;
    }
    
    /**
     * @brief True when parse() returned false because usage was printed
     */
    bool help_requested() const { return help_requested_; }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }
    
    void show_help() const {
        std::cout << description_ << "\n\n";

        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " --checkup FILE [OPTIONS]\n";
        std::cout << "    " << program_name_ << " --create-config FILE\n";
        std::cout << "    " << program_name_ << " --cleanup-days N [--output-dir DIR]\n\n";

        std::cout << "INPUT:\n";
        print_help_section("checkup", "Checkup JSON file to export");
        print_help_section("config", "Load settings from a JSON configuration file");
        print_help_section("create-config", "Write a default configuration file and exit");
        std::cout << "\n";

        std::cout << "EXPORT OPTIONS:\n";
        print_help_section("formats", "document,text,photos,combined (default: document,text)");
        print_help_section("output-dir", "Exports root directory (default: exports)");
        print_help_section("naming", "Photo names: structured,sequential,timestamp (default: structured)");
        print_help_section("quality", "Photo quality: original,optimized,compressed (default: optimized)");
        print_help_section("photo-width", "Target photo width in pixels (default: 800)");
        print_help_section("max-photos", "Photos per module in the document (default: 4)");
        print_help_section("no-photos", "Leave photos out of the document");
        print_help_section("no-notes", "Leave item notes out of the reports");
        print_help_section("no-photo-index", "Do not write FOTO/INDICE_FOTO.txt");
        print_help_section("no-timestamp", "Export directory without date prefix");
        print_help_section("manifest", "Write export_manifest.json");
        print_help_section("estimate-only", "Print the size/time estimate and exit");
        std::cout << "\n";

        std::cout << "MAINTENANCE:\n";
        print_help_section("cleanup-days", "Delete exports older than N days, then exit");
        std::cout << "\n";

        std::cout << "LOGGING:\n";
        print_help_section("log-level", "1=ERROR .. 6=TRACE, optionally per component: \"4,PhotoExportManager=6\"");
        print_help_section("log-file", "Append log output to a file");
        print_help_section("quiet", "Errors only (same as --log-level 1)");
        print_help_section("version", "Show version information");
        std::cout << "\n";

        std::cout << "EXAMPLES:\n";
        std::cout << "    " << program_name_ << " --checkup checkup.json --formats combined\n";
        std::cout << "    " << program_name_ << " --checkup checkup.json --formats photos --naming sequential --quality original\n";
        std::cout << "    " << program_name_ << " --checkup checkup.json --estimate-only\n";
    }

private:
    void print_help_section(const std::string& option_name, const std::string& description) const {
        auto it = options_.find(option_name);
        if (it == options_.end()) {
            return;
        }
        const auto& option = it->second;
        std::string label = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
        label += "--" + option.long_name;
        if (option.has_value) {
            label += " VALUE";
        }
        if (label.size() < HELP_COLUMN) {
            label.append(HELP_COLUMN - label.size(), ' ');
        } else {
            label += "  ";
        }
        std::cout << "    " << label << description << "\n";
    }

    static constexpr size_t HELP_COLUMN = 28;

    std::string program_name_;
    std::string description_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;
};

} // namespace qreport