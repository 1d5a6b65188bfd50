#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sfs::config {

constexpr static uintmax_t MAX_SCAN_SIZE_BYTES = 100 * 1024 * 1024; // 100MB

struct FuseConfig {
    std::filesystem::path source_root;
    std::filesystem::path mount_point;
    std::vector<std::string> options = {"default_permissions"};
    double attr_timeout = 1.0;
    double entry_timeout = 1.0;
    unsigned int worker_threads = 8;
};

struct ScanningConfig {
    size_t cache_capacity = 4096;
    unsigned int engine_pool_size = 4;
    std::filesystem::path database_dir = "/var/lib/clamav";
    std::chrono::milliseconds scan_timeout{30000};
    std::chrono::milliseconds acquire_timeout{10000};
    uintmax_t max_scan_size = MAX_SCAN_SIZE_BYTES;
};

struct LayerConfig {
    std::string name;
    std::filesystem::path source;
    std::filesystem::path mount_point;
    std::string fs_type = "ext4";
    std::vector<std::string> options;
    bool read_only = false;
};

struct ShutdownConfig {
    std::chrono::milliseconds drain_timeout{10000};
    unsigned int unmount_retries = 5;
    std::chrono::milliseconds unmount_backoff{100};
    std::chrono::milliseconds unmount_timeout{5000};
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum sentryfs = spdlog::level::info;   // startup and shutdown milestones
    spdlog::level::level_enum fuse     = spdlog::level::warn;   // per-op tracing is debug only
    spdlog::level::level_enum scan     = spdlog::level::info;
    spdlog::level::level_enum mount    = spdlog::level::info;
    spdlog::level::level_enum shutdown = spdlog::level::info;
    spdlog::level::level_enum config   = spdlog::level::info;
};

struct LoggingConfig {
    std::filesystem::path log_dir = "/var/log/sentryfs";
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::info;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct Config {
    FuseConfig fuse;
    ScanningConfig scanning;
    std::vector<LayerConfig> layers;
    ShutdownConfig shutdown;
    LoggingConfig logging;
};

inline const std::filesystem::path DEFAULT_CONFIG_PATH = "/etc/sentryfs/config.yaml";

Config loadConfig(const std::filesystem::path& path);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const FuseConfig& c);
void to_json(nlohmann::json& j, const ScanningConfig& c);
void to_json(nlohmann::json& j, const LayerConfig& c);
void to_json(nlohmann::json& j, const ShutdownConfig& c);
void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

}
