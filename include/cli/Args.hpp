#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sfs::config { struct Config; }

namespace sfs::cli {

struct ImageSpec {
    std::filesystem::path image;
    std::filesystem::path mountPoint;
    std::string fsType = "ext4";
};

struct Args {
    std::optional<std::filesystem::path> configPath;
    std::vector<std::string> fuseOptions;
    std::vector<ImageSpec> images;
    std::optional<size_t> cacheCapacity;
    std::filesystem::path source;
    std::filesystem::path mountPoint;
    bool help = false;
};

// Throws std::invalid_argument describing the first problem found.
Args parse(const std::vector<std::string>& argv);
Args parse(int argc, char** argv);

ImageSpec parseImageSpec(const std::string& spec);

std::string usage(const std::string& program);

// Layers the command line over the file config.
void applyOverrides(const Args& args, config::Config& cfg);

}
