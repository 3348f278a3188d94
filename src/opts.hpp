#pragma once

#ifndef __OPTS_HPP
#define __OPTS_HPP

#include <map>
#include <vector>
#include <string>
#include <fstream>
#include <optional>
#include <algorithm>
#include <filesystem>

// cxxopts
#include <cxxopts.hpp>
// nlohmann_json
#include <nlohmann/json.hpp>

// logging
#include <log.hpp>
#include <utils.hpp>

namespace opts {

// value kind of a registered option, used to read it back without probing casts
enum class kind_t { boolean, integer, real, text };

template <typename T>
constexpr kind_t kind_of() {
    if constexpr (std::is_same_v<T, bool>) return kind_t::boolean;
    else if constexpr (std::is_integral_v<T>) return kind_t::integer;
    else if constexpr (std::is_floating_point_v<T>) return kind_t::real;
    else return kind_t::text;
}

inline std::optional<cxxopts::HelpOptionDetails> get_option_detail(cxxopts::Options const& options, std::string const& key) {
    for (const auto& group : options.groups()) {
        const auto& help_group = options.group_help(group);
        for (const auto& opt : help_group.options) {
            if (!opt.l.empty() && std::find(opt.l.begin(), opt.l.end(), key) != opt.l.end())
                return opt;
            if (!opt.s.empty() && opt.s == key)
                return opt;
        }
    }
    return std::nullopt;
}

// writes one key into a JSON arguments file, the file is created when missing
template <typename T>
bool set_json_value(std::string const& path, std::string const& key, T const& value) {
    nlohmann::json j = nlohmann::json::object();
    if (std::filesystem::exists(path)) {
        std::ifstream in(path);
        try {
            j = nlohmann::json::parse(in);
        } catch (const nlohmann::json::exception& e) {
            LOG_ERROR_FMT( "failed to parse JSON config from {}: {}", path, e.what() );
            return false;
        }
        if (!j.is_object()) {
            LOG_ERROR_FMT( "JSON config {} is not an object", path );
            return false;
        }
    }
    j[key] = value;
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR_FMT( "failed to open file for writing: {}", path );
        return false;
    }
    out << j.dump(4);
    return true;
}

class parser {
public:
    explicit parser(int argc, const char* const argv[], std::string program = "app", std::string help = ""): name_app(std::move(program)), options(name_app, help) {
        origin_args.assign(argv, argv + argc);
        merged_args = origin_args;
    }

    cxxopts::Options& get_options() { return options; }

    void add_default(std::string conf_def = "") {
        options.add_options()
            ("config", "load arguments from JSON", cxxopts::value<std::string>()->default_value(conf_def))
            ("save_args", "save arguments to JSON", cxxopts::value<std::string>()->default_value(""))
            ("save_opts", "save options to JSON", cxxopts::value<std::string>()->default_value(""))
            ("help", "print help");
    }

    template <typename T>
    void add_option(std::string const& key, std::string const& desc, T const& def_value) {
        using namespace cxxopts;
        if constexpr (std::is_same_v<T, bool>) {
            options.add_options()(key, desc, value<bool>()->default_value(def_value ? "true" : "false"));
        } else if constexpr (std::is_same_v<T, int>) {
            options.add_options()(key, desc, value<int>()->default_value(std::to_string(def_value)));
        } else if constexpr (std::is_same_v<T, double>) {
            options.add_options()(key, desc, value<double>()->default_value(std::to_string(def_value)));
        } else if constexpr (std::is_same_v<T, std::string>) {
            options.add_options()(key, desc, value<std::string>()->default_value(def_value));
        } else {
            LOG_WARNING_FMT( "unsupported type for add_option for key: {}", key );
            return;
        }
        kinds[key] = kind_of<T>();
    }

    // saves requested files, returns true if the process should exit
    bool do_default() {
        bool res = false;
        if (result.count("help")) {
            LOG_INFO_FMT( options.help() );
            return true;
        }
        for (auto const& [key, just_result] : { std::pair{ "save_args", true }, std::pair{ "save_opts", false } }) {
            std::string const save_path = result[key].as<std::string>();
            if (save_path.empty())
                continue;
            if (!to_file(save_path, just_result))
                LOG_ERROR_FMT( "failed to save {} to file: {}", key, save_path );
            res = true;
        }
        return res;
    }

    // parses the command line, then overlays the --config JSON file for keys not given on the command line
    bool parse() {
        try {
            auto result_pre = options.parse(static_cast<int>(merged_args.size()), to_c_argv(merged_args));
            std::string const config_path = result_pre["config"].as<std::string>();
            if (!config_path.empty()) {
                if (std::filesystem::exists(config_path)) {
                    std::ifstream file(config_path);
                    try {
                        from_json(nlohmann::json::parse(file));
                    } catch (const nlohmann::json::exception& e) {
                        LOG_ERROR_FMT( "failed to parse JSON config from {}: {}", config_path, e.what() );
                    }
                } else {
                    LOG_WARNING_FMT( "config file not found: {}", config_path );
                }
            }
            result = options.parse(static_cast<int>(merged_args.size()), to_c_argv(merged_args));
        } catch (const cxxopts::exceptions::exception& e) {
            LOG_ERROR_FMT( "error parsing options: {}", e.what() );
            return false;
        }
        return true;
    }

    inline auto const help() const {
        return options.help();
    }

    inline cxxopts::ParseResult& get_parsed() {
        return result;
    }

    inline bool is_key_default(std::string const& key) const {
        return key == "help" || key == "config" || key == "save_opts" || key == "save_args";
    }

    // just_result: only the options given explicitly, otherwise every option with its current value
    nlohmann::json to_json(bool just_result = true) const {
        nlohmann::json j = nlohmann::json::object();
        for (auto const& [key, kind] : kinds) {
            if (is_key_default(key))
                continue;
            if (just_result && !result.count(key))
                continue;
            switch (kind) {
                case kind_t::boolean: j[key] = result[key].as<bool>(); break;
                case kind_t::integer: j[key] = result[key].as<int>(); break;
                case kind_t::real: j[key] = result[key].as<double>(); break;
                case kind_t::text: j[key] = result[key].as<std::string>(); break;
            }
        }
        return j;
    }

    std::map<std::string, std::string> to_map(bool just_result = true) const {
        std::map<std::string, std::string> result_map;
        for (auto const& [key, value] : to_json(just_result).items())
            result_map[key] = value.is_string() ? value.get<std::string>() : value.dump();
        return result_map;
    }

    bool to_file(std::string const& path, bool just_result = true) const {
        std::ofstream file(path);
        if (!file.is_open()) {
            LOG_ERROR_FMT( "failed to open file for writing: {}", path );
            return false;
        }
        file << to_json(just_result).dump(4);
        return true;
    }

private:

    void set(std::string const& key, std::string const& value) {
        std::string kv = "--" + key + "=" + value;
        auto it = std::find_if(merged_args.begin(), merged_args.end(), [&](const std::string& s) {
            return s.rfind("--" + key + "=", 0) == 0;
        });
        if (it != merged_args.end()) {
            *it = kv;
        } else {
            merged_args.push_back(kv);
        }
    }

    void from_json(nlohmann::json const& j) {
        for (auto it = j.begin(); it != j.end(); ++it) {
            std::string const& key = it.key();
            if (!kinds.count(key)) {
                LOG_WARNING_FMT( "unknown key in JSON config: {}", key );
                continue;
            }
            // command line wins
            bool already_in_cli = std::any_of(origin_args.begin(), origin_args.end(), [&](const std::string& s) {
                return s.rfind("--" + key + "=", 0) == 0 || s == "--" + key;
            });
            if (already_in_cli)
                continue;
            auto const& value = it.value();
            if (value.is_boolean()) {
                set(key, value.get<bool>() ? "true" : "false");
            } else if (value.is_number_integer()) {
                set(key, std::to_string(value.get<long long>()));
            } else if (value.is_number_float()) {
                set(key, std::to_string(value.get<double>()));
            } else if (value.is_string()) {
                set(key, value.get<std::string>());
            } else if (!value.is_null()) {
                LOG_WARNING_FMT( "unsupported json type (e.g., array, object) for key: {}", key );
            }
        }
    }

    char** to_c_argv(std::vector<std::string>& args) {
        c_args.clear();
        for (auto& s : args) {
            c_args.push_back(s.data());
        }
        c_args.push_back(nullptr);
        return c_args.data();
    }

    std::string name_app;
    cxxopts::Options options;
    cxxopts::ParseResult result;
    std::map<std::string, kind_t> kinds;
    std::vector<char*> c_args;
    std::vector<std::string> origin_args;
    std::vector<std::string> merged_args;
};

} // namespace opts

#endif //__OPTS_HPP
