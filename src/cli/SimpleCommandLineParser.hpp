/**
 * @file SimpleCommandLineParser.hpp
 * @brief Small option parser for the terrain3d command line
 *
 * Long options (--name VALUE, --name=VALUE), single-letter aliases (-n VALUE)
 * and boolean flags. Options are grouped into help sections in the order
 * they are registered.
 */

#pragma once

#include <cctype>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace terrain3d {

class SimpleCommandLineParser {
public:
    struct Option {
        std::string long_name;
        std::string short_name;
        std::string description;
        bool has_value = true;
        size_t section = 0;
    };

    SimpleCommandLineParser(const std::string& program_name, const std::string& description)
        : program_name_(program_name), description_(description) {
        sections_.push_back("OPTIONS");
    }

    /**
     * @brief Start a new help section; later options are listed under it
     */
    void begin_section(const std::string& title) {
        if (order_.empty() || options_[order_.back()].section != sections_.size() - 1) {
            sections_.back() = title;
        } else {
            sections_.push_back(title);
        }
    }

    void add_option(const std::string& long_name, const std::string& short_name,
                    const std::string& description) {
        register_option({long_name, short_name, description, true, sections_.size() - 1});
    }

    void add_flag(const std::string& long_name, const std::string& short_name,
                  const std::string& description) {
        register_option({long_name, short_name, description, false, sections_.size() - 1});
    }

    /**
     * @brief Parse argv; prints help or the first error and returns false
     *
     * help_requested() tells the two apart.
     */
    bool parse(int argc, char* argv[]) {
        values_.clear();
        help_requested_ = false;

        std::vector<std::string> args(argv + 1, argv + argc);
        for (const auto& arg : args) {
            if (arg == "--help" || arg == "-h") {
                help_requested_ = true;
                show_help();
                return false;
            }
        }

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (!is_option_token(arg)) {
                std::cerr << "Unexpected argument: " << arg << std::endl;
                return false;
            }

            std::string name;
            std::optional<std::string> inline_value;
            const Option* option = nullptr;

            if (arg.rfind("--", 0) == 0) {
                name = arg.substr(2);
                size_t eq_pos = name.find('=');
                if (eq_pos != std::string::npos) {
                    inline_value = name.substr(eq_pos + 1);
                    name = name.substr(0, eq_pos);
                }
                auto it = options_.find(name);
                if (it != options_.end()) option = &it->second;
            } else {
                auto alias = short_to_long_.find(arg.substr(1));
                if (alias != short_to_long_.end()) option = &options_.at(alias->second);
            }

            if (!option) {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }

            if (!option->has_value) {
                if (inline_value) {
                    std::cerr << "Flag --" << option->long_name << " does not take a value" << std::endl;
                    return false;
                }
                values_[option->long_name] = "true";
                continue;
            }

            if (inline_value) {
                values_[option->long_name] = *inline_value;
            } else if (i + 1 < args.size() && !is_option_token(args[i + 1])) {
                values_[option->long_name] = args[++i];
            } else {
                std::cerr << "Option " << arg << " requires a value" << std::endl;
                return false;
            }
        }

        return true;
    }

    bool help_requested() const { return help_requested_; }

    std::optional<std::string> get(const std::string& option_name) const {
        auto it = values_.find(option_name);
        if (it == values_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool get_flag(const std::string& option_name) const {
        return values_.count(option_name) > 0;
    }

    /**
     * @brief Value converted with operator>>; nullopt unless the whole text converts
     */
    template<typename T>
    std::optional<T> get_as(const std::string& option_name) const {
        auto value = get(option_name);
        if (!value) {
            return std::nullopt;
        }

        std::istringstream iss(*value);
        T result;
        if (!(iss >> result)) {
            return std::nullopt;
        }
        iss >> std::ws;
        if (!iss.eof()) {
            return std::nullopt;
        }
        return result;
    }

    void show_help() const {
        std::cout << program_name_ << " - " << description_ << "\n";
        std::cout << "USAGE:\n    " << program_name_ << " [OPTIONS]\n";

        for (size_t s = 0; s < sections_.size(); ++s) {
            std::cout << "\n" << sections_[s] << ":\n";
            for (const auto& name : order_) {
                const Option& option = options_.at(name);
                if (option.section != s) continue;

                std::string label = option.short_name.empty() ? "    " : "-" + option.short_name + ", ";
                label += "--" + option.long_name;
                if (option.has_value) label += " VALUE";
                std::cout << "    " << std::left << std::setw(30) << label << option.description << "\n";
            }
        }

        std::cout << "\n    " << std::left << std::setw(30) << "-h, --help" << "Show this help\n";
    }

private:
    std::string program_name_;
    std::string description_;
    std::vector<std::string> sections_;
    std::vector<std::string> order_;
    std::map<std::string, Option> options_;
    std::map<std::string, std::string> short_to_long_;
    std::map<std::string, std::string> values_;
    bool help_requested_ = false;

    void register_option(const Option& option) {
        if (options_.count(option.long_name) == 0) {
            order_.push_back(option.long_name);
        }
        options_[option.long_name] = option;
        if (!option.short_name.empty()) {
            short_to_long_[option.short_name] = option.long_name;
        }
    }

    // Negative numbers and coordinate lists ("-0.20,0.05") are values, not options
    static bool is_option_token(const std::string& arg) {
        if (arg.size() < 2 || arg[0] != '-') {
            return false;
        }
        return !(std::isdigit(static_cast<unsigned char>(arg[1])) || arg[1] == '.');
    }
};

} // namespace terrain3d
