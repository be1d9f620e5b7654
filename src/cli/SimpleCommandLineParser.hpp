/**
 * @file SimpleCommandLineParser.hpp
 * @brief Lightweight command-line parser for the rx-enrich tool
 */

#pragma once

#include <cctype>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace rxgis {

/**
 * @brief Simple command-line argument parser
 *
 * Supports --long, --long=value, -s short aliases and flags. Options are
 * shown in help in the order they were added, grouped under the most
 * recent add_section() heading.
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
        std::string section;

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

    /**
     * @brief Start a new help section for subsequently added options
     */
    void add_section(const std::string& title) {
        current_section_ = title;
    }

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description, bool required = false,
                    const std::string& default_value = "") {
        register_option(Option(long_name, short_name, description, required, true, default_value));
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option(Option(long_name, short_name, description, false, false));
    }

    /**
     * @brief Parse command line arguments
     * @return false on errors or when help was requested (see help_requested())
     */
    bool parse(int argc, char* argv[]) {
        args_.clear();
        parsed_values_.clear();
        positional_args_.clear();
        help_requested_ = false;

        for (int i = 1; i < argc; ++i) {
            args_.push_back(argv[i]);
        }

        for (const auto& arg : args_) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args_.size(); ++i) {
            const std::string& arg = args_[i];

            if (arg.starts_with("--")) {
                std::string option_name = arg.substr(2);

                // Handle --option=value format
                size_t eq_pos = option_name.find('=');
                std::string value;
                bool inline_value = false;
                if (eq_pos != std::string::npos) {
                    value = option_name.substr(eq_pos + 1);
                    option_name = option_name.substr(0, eq_pos);
                    inline_value = true;
                }

                auto it = options_.find(option_name);
                if (it == options_.end()) {
                    std::cerr << "Unknown option: --" << option_name << std::endl;
                    return false;
                }

                if (it->second.has_value) {
                    if (!inline_value) {
                        if (!has_value_at(i + 1)) {
                            std::cerr << "Option --" << option_name << " requires a value" << std::endl;
                            return false;
                        }
                        value = args_[++i];
                    }
                    parsed_values_[option_name] = value;
                } else {
                    parsed_values_[option_name] = "true";
                }

            } else if (arg.starts_with("-") && arg.size() > 1 && !looks_numeric(arg)) {
                std::string short_name = arg.substr(1);

                auto alias = short_to_long_.find(short_name);
                if (alias == short_to_long_.end()) {
                    std::cerr << "Unknown option: -" << short_name << std::endl;
                    return false;
                }

                const std::string& option_name = alias->second;
                if (options_.at(option_name).has_value) {
                    if (!has_value_at(i + 1)) {
                        std::cerr << "Option -" << short_name << " requires a value" << std::endl;
                        return false;
                    }
                    parsed_values_[option_name] = args_[++i];
                } else {
                    parsed_values_[option_name] = "true";
                }
            } else {
                positional_args_.push_back(arg);
            }
        }

        for (const auto& [name, option] : options_) {
            if (option.required && parsed_values_.find(name) == parsed_values_.end()) {
                std::cerr << "Required option --" << name << " not provided" << std::endl;
                return false;
            }
        }

        for (const auto& [name, option] : options_) {
            if (parsed_values_.find(name) == parsed_values_.end() && !option.default_value.empty()) {
                parsed_values_[name] = option.default_value;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

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
        if (iss >> result && iss.eof()) {
            return result;
        }
        return std::nullopt;
    }

    const std::vector<std::string>& get_positional() const {
        return positional_args_;
    }

    void show_help() const {
        std::cout << description_ << "\n\n";
        std::cout << "USAGE:\n";
        std::cout << "    " << program_name_ << " [OPTIONS]\n";

        std::string section;
        for (const auto& name : order_) {
            const auto& option = options_.at(name);
            if (option.section != section || &name == &order_.front()) {
                section = option.section;
                std::cout << "\n" << (section.empty() ? "OPTIONS" : section) << ":\n";
            }
            print_help_line(option);
        }

        std::cout << "\n    -h, --help               Show this help\n";
    }

private:
    std::string program_name_;
    std::string description_;
    std::string current_section_;
    std::map<std::string, Option> options_;
    std::vector<std::string> order_;
    std::map<std::string, std::string> short_to_long_;
    std::vector<std::string> args_;
    std::map<std::string, std::string> parsed_values_;
    std::vector<std::string> positional_args_;
    bool help_requested_ = false;

    void register_option(Option option) {
        option.section = current_section_;
        if (options_.find(option.long_name) == options_.end()) {
            order_.push_back(option.long_name);
        }
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
        options_[option.long_name] = option;
    }

    // Negative numbers ("-13.4", "-9.3,13.2") are values, not options
    static bool looks_numeric(const std::string& arg) {
        return arg.size() > 1 && arg[0] == '-' &&
               (std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }

    bool has_value_at(size_t index) const {
        return index < args_.size() && (!args_[index].starts_with("-") || looks_numeric(args_[index]));
    }

    static void print_help_line(const Option& option) {
        std::string usage = "--" + option.long_name;
        if (!option.short_name.empty()) {
            usage = "-" + option.short_name + ", " + usage;
        }
        if (option.has_value) {
            usage += " VALUE";
        }

        std::cout << "    " << usage;
        if (usage.size() < 28) {
            std::cout << std::string(28 - usage.size(), ' ');
        } else {
            std::cout << "\n" << std::string(32, ' ');
        }
        std::cout << option.description;
        if (!option.default_value.empty()) {
            std::cout << " (default: " << option.default_value << ")";
        }
        std::cout << "\n";
    }
};

} // namespace rxgis
