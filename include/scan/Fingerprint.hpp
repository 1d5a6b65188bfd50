#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <sys/stat.h>

namespace sfs::scan {

// Identity of a file's content as far as the verdict cache is concerned.
// Not a content hash: equal fingerprints are assumed to mean equal bytes.
struct Fingerprint {
    std::filesystem::path path;
    uintmax_t size = 0;
    int64_t mtimeSec = 0;
    int64_t mtimeNsec = 0;

    static Fingerprint fromStat(const std::filesystem::path& path, const struct stat& st) {
        return {
            .path = path,
            .size = static_cast<uintmax_t>(st.st_size),
            .mtimeSec = static_cast<int64_t>(st.st_mtim.tv_sec),
            .mtimeNsec = static_cast<int64_t>(st.st_mtim.tv_nsec)
        };
    }

    [[nodiscard]] std::string toString() const {
        return path.string() + "@" + std::to_string(size) + ":" +
               std::to_string(mtimeSec) + "." + std::to_string(mtimeNsec);
    }

    bool operator==(const Fingerprint& other) const = default;
};

// Borrowed read access to the bytes being judged.
struct ByteSource {
    int fd = -1;
    std::filesystem::path path;
};

}
