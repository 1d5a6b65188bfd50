#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <filesystem>

namespace sfs::log {

class Registry {
public:
    // Builds every named logger from ConfigRegistry's logging section.
    static void init();

    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> sentryfs()  { return get("sentryfs"); }
    static std::shared_ptr<spdlog::logger> fuse()      { return get("fuse"); }
    static std::shared_ptr<spdlog::logger> scan()      { return get("scan"); }
    static std::shared_ptr<spdlog::logger> mount()     { return get("mount"); }
    static std::shared_ptr<spdlog::logger> shutdown()  { return get("shutdown"); }
    static std::shared_ptr<spdlog::logger> config()    { return get("config"); }
    static std::shared_ptr<spdlog::logger> audit()     { return get("audit"); }

    [[nodiscard]] static bool isInitialized();

    [[nodiscard]] static const std::filesystem::path& auditLogPath() { return audit_log_path_; }

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;
    static inline std::filesystem::path audit_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;
    static inline std::shared_ptr<spdlog::sinks::basic_file_sink_mt>    audit_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
