#pragma once

#include "config/Config.hpp"
#include "config/util.hpp"

#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sfs::config;

template<>
struct convert<FuseConfig> {
    static Node encode(const FuseConfig& rhs) {
        Node node;
        node["source_root"] = rhs.source_root.string();
        node["mount_point"] = rhs.mount_point.string();
        node["options"] = rhs.options;
        node["attr_timeout"] = rhs.attr_timeout;
        node["entry_timeout"] = rhs.entry_timeout;
        node["worker_threads"] = rhs.worker_threads;
        return node;
    }

    static bool decode(const Node& node, FuseConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.source_root = node["source_root"].as<std::string>("");
        rhs.mount_point = node["mount_point"].as<std::string>("");
        if (node["options"]) rhs.options = node["options"].as<std::vector<std::string>>();
        rhs.attr_timeout = node["attr_timeout"].as<double>(1.0);
        rhs.entry_timeout = node["entry_timeout"].as<double>(1.0);
        rhs.worker_threads = node["worker_threads"].as<unsigned int>(8);
        return true;
    }
};

template<>
struct convert<ScanningConfig> {
    static Node encode(const ScanningConfig& rhs) {
        Node node;
        node["cache_capacity"] = rhs.cache_capacity;
        node["engine_pool_size"] = rhs.engine_pool_size;
        node["database_dir"] = rhs.database_dir.string();
        node["scan_timeout_ms"] = rhs.scan_timeout.count();
        node["acquire_timeout_ms"] = rhs.acquire_timeout.count();
        node["max_scan_size"] = formatByteSize(rhs.max_scan_size);
        return node;
    }

    static bool decode(const Node& node, ScanningConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.cache_capacity = node["cache_capacity"].as<size_t>(4096);
        rhs.engine_pool_size = node["engine_pool_size"].as<unsigned int>(4);
        rhs.database_dir = node["database_dir"].as<std::string>("/var/lib/clamav");
        rhs.scan_timeout = std::chrono::milliseconds(node["scan_timeout_ms"].as<long>(30000));
        rhs.acquire_timeout = std::chrono::milliseconds(node["acquire_timeout_ms"].as<long>(10000));
        rhs.max_scan_size = parseByteSize(node["max_scan_size"].as<std::string>("100MB"));
        return true;
    }
};

template<>
struct convert<LayerConfig> {
    static Node encode(const LayerConfig& rhs) {
        Node node;
        node["name"] = rhs.name;
        node["source"] = rhs.source.string();
        node["mount_point"] = rhs.mount_point.string();
        node["fs_type"] = rhs.fs_type;
        node["options"] = rhs.options;
        node["read_only"] = rhs.read_only;
        return node;
    }

    static bool decode(const Node& node, LayerConfig& rhs) {
        if (!node.IsMap()) return false;
        if (!node["source"] || !node["mount_point"]) return false;
        rhs.source = node["source"].as<std::string>();
        rhs.mount_point = node["mount_point"].as<std::string>();
        rhs.name = node["name"].as<std::string>(rhs.mount_point.filename().string());
        rhs.fs_type = node["fs_type"].as<std::string>("ext4");
        if (node["options"]) rhs.options = node["options"].as<std::vector<std::string>>();
        rhs.read_only = node["read_only"].as<bool>(false);
        return true;
    }
};

template<>
struct convert<ShutdownConfig> {
    static Node encode(const ShutdownConfig& rhs) {
        Node node;
        node["drain_timeout_ms"] = rhs.drain_timeout.count();
        node["unmount_retries"] = rhs.unmount_retries;
        node["unmount_backoff_ms"] = rhs.unmount_backoff.count();
        node["unmount_timeout_ms"] = rhs.unmount_timeout.count();
        return node;
    }

    static bool decode(const Node& node, ShutdownConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.drain_timeout = std::chrono::milliseconds(node["drain_timeout_ms"].as<long>(10000));
        rhs.unmount_retries = node["unmount_retries"].as<unsigned int>(5);
        rhs.unmount_backoff = std::chrono::milliseconds(node["unmount_backoff_ms"].as<long>(100));
        rhs.unmount_timeout = std::chrono::milliseconds(node["unmount_timeout_ms"].as<long>(5000));
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["sentryfs"] = to_std_string(spdlog::level::to_string_view(rhs.sentryfs));
        node["fuse"]     = to_std_string(spdlog::level::to_string_view(rhs.fuse));
        node["scan"]     = to_std_string(spdlog::level::to_string_view(rhs.scan));
        node["mount"]    = to_std_string(spdlog::level::to_string_view(rhs.mount));
        node["shutdown"] = to_std_string(spdlog::level::to_string_view(rhs.shutdown));
        node["config"]   = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.sentryfs = spdlog::level::from_str(node["sentryfs"].as<std::string>("info"));
        rhs.fuse = spdlog::level::from_str(node["fuse"].as<std::string>("warn"));
        rhs.scan = spdlog::level::from_str(node["scan"].as<std::string>("info"));
        rhs.mount = spdlog::level::from_str(node["mount"].as<std::string>("info"));
        rhs.shutdown = spdlog::level::from_str(node["shutdown"].as<std::string>("info"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("info"));
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("/var/log/sentryfs");
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("info"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

}
