#include "config/Config.hpp"
#include "config/config_yaml.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace sfs::config {

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    YAML::Node root = YAML::LoadFile(path.string());

    if (auto node = root["fuse"]) YAML::convert<FuseConfig>::decode(node, cfg.fuse);
    if (auto node = root["scanning"]) YAML::convert<ScanningConfig>::decode(node, cfg.scanning);
    if (auto node = root["layers"]) cfg.layers = node.as<std::vector<LayerConfig>>();
    if (auto node = root["shutdown"]) YAML::convert<ShutdownConfig>::decode(node, cfg.shutdown);
    if (auto node = root["logging"]) YAML::convert<LoggingConfig>::decode(node, cfg.logging);

    return cfg;
}

static std::string levelName(const spdlog::level::level_enum lvl) {
    const auto sv = spdlog::level::to_string_view(lvl);
    return {sv.data(), sv.size()};
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"fuse", c.fuse},
        {"scanning", c.scanning},
        {"layers", c.layers},
        {"shutdown", c.shutdown},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const FuseConfig& c) {
    j = {
        {"source_root", c.source_root.string()},
        {"mount_point", c.mount_point.string()},
        {"options", c.options},
        {"attr_timeout", c.attr_timeout},
        {"entry_timeout", c.entry_timeout},
        {"worker_threads", c.worker_threads}
    };
}

void to_json(nlohmann::json& j, const ScanningConfig& c) {
    j = {
        {"cache_capacity", c.cache_capacity},
        {"engine_pool_size", c.engine_pool_size},
        {"database_dir", c.database_dir.string()},
        {"scan_timeout_ms", c.scan_timeout.count()},
        {"acquire_timeout_ms", c.acquire_timeout.count()},
        {"max_scan_size", c.max_scan_size}
    };
}

void to_json(nlohmann::json& j, const LayerConfig& c) {
    j = {
        {"name", c.name},
        {"source", c.source.string()},
        {"mount_point", c.mount_point.string()},
        {"fs_type", c.fs_type},
        {"options", c.options},
        {"read_only", c.read_only}
    };
}

void to_json(nlohmann::json& j, const ShutdownConfig& c) {
    j = {
        {"drain_timeout_ms", c.drain_timeout.count()},
        {"unmount_retries", c.unmount_retries},
        {"unmount_backoff_ms", c.unmount_backoff.count()},
        {"unmount_timeout_ms", c.unmount_timeout.count()}
    };
}

void to_json(nlohmann::json& j, const SubsystemLogLevelsConfig& c) {
    j = {
        {"sentryfs", levelName(c.sentryfs)},
        {"fuse", levelName(c.fuse)},
        {"scan", levelName(c.scan)},
        {"mount", levelName(c.mount)},
        {"shutdown", levelName(c.shutdown)},
        {"config", levelName(c.config)}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", levelName(c.console_log_level)},
        {"file_log_level", levelName(c.file_log_level)},
        {"subsystem_levels", c.subsystem_levels}
    };
}

}
