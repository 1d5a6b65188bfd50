#pragma once

#include <cstring>
#include <stdexcept>
#include <string>

namespace sfs::types {

// Content was scanned and found infected; surfaces as EACCES.
class AccessDenied : public std::runtime_error {
public:
    AccessDenied(const std::string& path, std::string signature)
        : std::runtime_error("access denied to " + path + ": " + signature), signature_(std::move(signature)) {}

    [[nodiscard]] const std::string& signature() const { return signature_; }

private:
    std::string signature_;
};

// Scan could not complete; surfaces as EIO and is never cached.
class TransientScanFailure : public std::runtime_error {
public:
    TransientScanFailure(const std::string& path, const std::string& reason)
        : std::runtime_error("scan of " + path + " failed: " + reason) {}
};

// Programming error: a node was driven out of dependency order.
class MountOrderingViolation : public std::runtime_error {
public:
    explicit MountOrderingViolation(const std::string& what) : std::runtime_error(what) {}
};

class MountOperationFailure : public std::runtime_error {
public:
    MountOperationFailure(const std::string& node, const std::string& operation, const int err)
        : std::runtime_error(operation + " failed for " + node + ": " + std::strerror(err)), errno_(err) {}

    [[nodiscard]] int error() const { return errno_; }

private:
    int errno_;
};

class EngineInitFailure : public std::runtime_error {
public:
    explicit EngineInitFailure(const std::string& what) : std::runtime_error(what) {}
};

}
