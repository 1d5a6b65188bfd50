#pragma once

#include <string>
#include <utility>

namespace sfs::scan {

class Verdict {
public:
    enum class Kind { Clean, Infected, ScanError };

    static Verdict clean() { return Verdict(Kind::Clean, {}); }
    static Verdict infected(std::string signature) { return Verdict(Kind::Infected, std::move(signature)); }
    static Verdict error(std::string reason) { return Verdict(Kind::ScanError, std::move(reason)); }

    [[nodiscard]] Kind kind() const { return kind_; }
    [[nodiscard]] bool isClean() const { return kind_ == Kind::Clean; }
    [[nodiscard]] bool isInfected() const { return kind_ == Kind::Infected; }
    [[nodiscard]] bool isError() const { return kind_ == Kind::ScanError; }

    // Signature name for Infected, reason for ScanError, empty for Clean.
    [[nodiscard]] const std::string& detail() const { return detail_; }

    [[nodiscard]] std::string toString() const {
        switch (kind_) {
            case Kind::Clean: return "Clean";
            case Kind::Infected: return "Infected(" + detail_ + ")";
            case Kind::ScanError: return "ScanError(" + detail_ + ")";
        }
        return "Unknown";
    }

    bool operator==(const Verdict& other) const = default;

private:
    Verdict(const Kind kind, std::string detail) : kind_(kind), detail_(std::move(detail)) {}

    Kind kind_;
    std::string detail_;
};

}
