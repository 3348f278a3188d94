#pragma once

#ifndef __UTILS_HPP
#define __UTILS_HPP

#include <chrono>
#include <string>
#include <vector>
#include <cstdlib>
#include <cstdint>
#include <sstream>
#include <algorithm>
#include <string_view>

#include <unistd.h>

// logging
#include <log.hpp>

namespace utils {

inline bool is_int(std::string const& val) {
    if (val.empty()) return false;
    char* end = nullptr;
    std::strtol(val.c_str(), &end, 10);
    return end == val.c_str() + val.size();
}

template <typename T> std::basic_string<T> str_lower(std::basic_string<T> const& src) {
    std::basic_string<T> dst{ src };
    std::transform(dst.begin(), dst.end(), dst.begin(), [](const T v){ return static_cast<T>(std::tolower(v)); });
    return dst;
}

// "true"/"1"/"yes"/"on" in any case
inline bool to_bool(std::string const& val) {
    auto const v{ str_lower(val) };
    return v == "true" || v == "1" || v == "yes" || v == "on";
}

inline bool str_exists(std::string const& str, std::string const& sub) {
    return (str.find(sub)!=std::string::npos);
}

inline bool str_starts(std::string_view str, std::string_view prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

inline std::vector<std::string> str_split(std::string const& input, std::string const& delimiter) {
    std::string token;
    std::size_t pos_start = 0, pos_end, delim_len = delimiter.length();
    std::vector<std::string> tokens;

    while ((pos_end = input.find(delimiter, pos_start)) != std::string::npos) {
        token = input.substr(pos_start, pos_end - pos_start);
        pos_start = pos_end + delim_len;
        tokens.push_back(token);
    }

    tokens.push_back(input.substr(pos_start));
    return tokens;
}

inline std::string_view trim(std::string_view s) {
    s.remove_prefix(std::min(s.find_first_not_of(" \t\r\v\n"), s.size()));
    s.remove_suffix(std::min(s.size() - s.find_last_not_of(" \t\r\v\n") - 1, s.size()));
    return s;
}

// environment defaults for config_t

inline std::string env_or(char const* name, std::string const& def) {
    char const* val{ std::getenv(name) };
    return (val && *val) ? std::string(val) : def;
}

inline int env_or(char const* name, int def) {
    auto const val{ env_or(name, std::string()) };
    return is_int(val) ? std::stoi(val) : def;
}

inline bool env_or(char const* name, bool def) {
    auto const val{ env_or(name, std::string()) };
    return val.empty() ? def : to_bool(val);
}

inline std::string hostname() {
    char name[256]{ };
    if (gethostname(name, sizeof(name) - 1) != 0)
        return "localhost";
    return name;
}

inline std::int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

struct size_r {
    int width{ 0 };
    int height{ 0 };
    bool operator==(const size_r& other) const {
        return width == other.width && height == other.height;
    }
    bool valid() const { return width > 0 && height > 0; }
};

// "1920x1080", "1920*1080" or "1920,1080", zero size on failure
inline size_r str_to_size(std::string const& str) {
    size_r size;
    std::vector<std::string> tokens;
    if (str_exists(str, "x"))
        tokens = str_split(str, "x");
    else if (str_exists(str, "*"))
        tokens = str_split(str, "*");
    else if (str_exists(str, ","))
        tokens = str_split(str, ",");
    if (tokens.size() == 2 && is_int(tokens[0]) && is_int(tokens[1])) {
        size.width = std::stoi(tokens[0]);
        size.height = std::stoi(tokens[1]);
    }
    return size;
}

inline std::string size_to_str(size_r size) {
    return fmt::format("{}x{}", size.width, size.height);
}

} // namespace utils

#endif // #ifndef __UTILS_HPP
