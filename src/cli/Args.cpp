#include "cli/Args.hpp"
#include "config/Config.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <stdexcept>

namespace sfs::cli {

namespace {

void splitOptions(const std::string& list, std::vector<std::string>& out) {
    size_t start = 0;
    while (start <= list.size()) {
        const auto comma = list.find(',', start);
        const auto token = list.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        if (!token.empty()) out.push_back(token);
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
}

}

ImageSpec parseImageSpec(const std::string& spec) {
    const auto first = spec.find(':');
    if (first == std::string::npos || first == 0)
        throw std::invalid_argument("--image expects IMG:MOUNTPOINT[:FSTYPE], got '" + spec + "'");

    ImageSpec out;
    out.image = spec.substr(0, first);

    const auto second = spec.find(':', first + 1);
    out.mountPoint = spec.substr(first + 1, second == std::string::npos ? std::string::npos : second - first - 1);
    if (second != std::string::npos) out.fsType = spec.substr(second + 1);

    if (out.mountPoint.empty()) throw std::invalid_argument("--image '" + spec + "' has no mountpoint");
    if (out.fsType.empty()) throw std::invalid_argument("--image '" + spec + "' has an empty filesystem type");
    return out;
}

Args parse(const std::vector<std::string>& argv) {
    Args args;
    std::vector<std::string> positional;

    const auto valueOf = [&](size_t& i, const std::string& flag) -> const std::string& {
        if (i + 1 >= argv.size()) throw std::invalid_argument(flag + " requires a value");
        return argv[++i];
    };

    for (size_t i = 1; i < argv.size(); ++i) {
        const auto& a = argv[i];
        if (a == "-h" || a == "--help") {
            args.help = true;
        } else if (a == "-c" || a == "--config") {
            args.configPath = valueOf(i, a);
        } else if (a == "-o") {
            splitOptions(valueOf(i, a), args.fuseOptions);
        } else if (a.size() > 2 && a.rfind("-o", 0) == 0) {
            splitOptions(a.substr(2), args.fuseOptions);
        } else if (a == "--image") {
            args.images.push_back(parseImageSpec(valueOf(i, a)));
        } else if (a == "--cache-capacity") {
            const auto& v = valueOf(i, a);
            size_t used = 0;
            unsigned long long n = 0;
            try {
                n = std::stoull(v, &used);
            } catch (const std::logic_error&) {
                used = 0;
            }
            if (used != v.size() || v.empty() || v.front() == '-')
                throw std::invalid_argument("--cache-capacity expects a non-negative integer, got '" + v + "'");
            args.cacheCapacity = static_cast<size_t>(n);
        } else if (a.size() > 1 && a.front() == '-') {
            throw std::invalid_argument("unknown option " + a);
        } else {
            positional.push_back(a);
        }
    }

    if (args.help) return args;

    if (positional.size() != 2)
        throw std::invalid_argument(fmt::format("expected SOURCE and MOUNTPOINT, got {} positional arguments",
                                                positional.size()));

    args.source = positional[0];
    args.mountPoint = positional[1];
    return args;
}

Args parse(const int argc, char** argv) {
    std::vector<std::string> v;
    v.reserve(static_cast<size_t>(argc));
    for (int i = 0; i < argc; ++i) v.emplace_back(argv[i]);
    return parse(v);
}

std::string usage(const std::string& program) {
    return fmt::format(
        "Usage: {} [-c config.yaml] [-o opt[,opt...]] [--image IMG:MOUNTPOINT[:FSTYPE]]... "
        "[--cache-capacity N] SOURCE MOUNTPOINT\n"
        "\n"
        "Serves SOURCE at MOUNTPOINT, refusing access to files the antivirus engine flags.\n"
        "\n"
        "Options:\n"
        "  -c, --config PATH       configuration file (default {})\n"
        "  -o opt[,opt...]         FUSE mount options (allow_other, auto_unmount, ro, fsname=...)\n"
        "  --image IMG:MP[:FSTYPE] loop-mount IMG at MP before serving; repeatable\n"
        "  --cache-capacity N      number of verdicts kept in memory\n"
        "  -h, --help              print this help\n",
        program, config::DEFAULT_CONFIG_PATH.string());
}

void applyOverrides(const Args& args, config::Config& cfg) {
    cfg.fuse.source_root = args.source;
    cfg.fuse.mount_point = args.mountPoint;

    for (const auto& o : args.fuseOptions)
        if (std::ranges::find(cfg.fuse.options, o) == cfg.fuse.options.end()) cfg.fuse.options.push_back(o);

    for (const auto& img : args.images) {
        cfg.layers.push_back(config::LayerConfig{
            .name = img.mountPoint.filename().string(),
            .source = img.image,
            .mount_point = img.mountPoint,
            .fs_type = img.fsType,
            .options = {},
            .read_only = false
        });
    }

    if (args.cacheCapacity) cfg.scanning.cache_capacity = *args.cacheCapacity;
}

}
