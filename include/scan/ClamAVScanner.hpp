#pragma once

#include "scan/Scanner.hpp"

#include <clamav.h>

#include <filesystem>
#include <memory>

namespace sfs::scan {

// Shared compiled signature engine. Compiled engines are safe to scan with
// concurrently, so every pooled handle references the same one.
class ClamAVEngine {
public:
    explicit ClamAVEngine(const std::filesystem::path& databaseDir);
    ~ClamAVEngine();

    ClamAVEngine(const ClamAVEngine&) = delete;
    ClamAVEngine& operator=(const ClamAVEngine&) = delete;

    [[nodiscard]] const cl_engine* handle() const { return engine_; }
    [[nodiscard]] unsigned int signatureCount() const { return signatures_; }

private:
    cl_engine* engine_ = nullptr;
    unsigned int signatures_ = 0;
};

class ClamAVScanner final : public Scanner {
public:
    explicit ClamAVScanner(std::shared_ptr<const ClamAVEngine> engine);

    Verdict scan(const ByteSource& source) override;

private:
    std::shared_ptr<const ClamAVEngine> engine_;
    cl_scan_options options_{};
};

}
