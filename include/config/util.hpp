#pragma once

#include <array>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace sfs::config {

namespace detail {

constexpr uintmax_t KiB = 1024;
constexpr uintmax_t MiB = 1024 * KiB;
constexpr uintmax_t GiB = 1024 * MiB;

// Longest suffixes first so "MB" is not read as "B".
inline constexpr std::array<std::pair<const char*, uintmax_t>, 7> sizeSuffixes{{
    {"GB", GiB}, {"MB", MiB}, {"KB", KiB}, {"G", GiB}, {"M", MiB}, {"K", KiB}, {"B", 1},
}};

inline std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

}

// "512B", "64K", "100MB", "2G". A bare number is megabytes.
inline uintmax_t parseByteSize(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Size string cannot be empty");

    const auto digits = str.find_first_not_of("0123456789");
    if (digits == 0) throw std::invalid_argument("Size must start with a number: '" + str + "'");

    const auto value = std::stoull(str.substr(0, digits));
    if (digits == std::string::npos) return value * detail::MiB;

    const auto suffix = detail::upper(str.substr(digits));
    for (const auto& [name, scale] : detail::sizeSuffixes)
        if (suffix == name) return value * scale;

    throw std::invalid_argument("Unknown size suffix in '" + str + "'");
}

inline std::string formatByteSize(const uintmax_t bytes) {
    if (bytes != 0 && bytes % detail::GiB == 0) return std::to_string(bytes / detail::GiB) + "GB";
    if (bytes % detail::MiB == 0) return std::to_string(bytes / detail::MiB) + "MB";
    if (bytes % detail::KiB == 0) return std::to_string(bytes / detail::KiB) + "KB";
    return std::to_string(bytes) + "B";
}

}
