#pragma once

#include <filesystem>
#include <string>

namespace sfs::mount {

enum class SourceKind { Image, BlockDevice, Directory, Missing };

// Seam over the kernel calls the mount layer makes. Every call returns 0 on
// success or the errno value describing the failure.
class Syscalls {
public:
    virtual ~Syscalls() = default;

    virtual SourceKind sourceKind(const std::filesystem::path& source) = 0;

    virtual int makeDirectories(const std::filesystem::path& dir) = 0;

    virtual int mount(const std::string& source, const std::filesystem::path& target,
                      const std::string& fsType, unsigned long flags, const std::string& data) = 0;

    virtual int unmount(const std::filesystem::path& target, int flags) = 0;

    virtual int loopFindFree(int& index) = 0;

    // Binds the image to the device with autoclear set and hands back the
    // open device descriptor in deviceFd. The binding lasts while deviceFd
    // or a mount holds the device, so the caller keeps it open until release.
    virtual int loopAttach(int index, const std::filesystem::path& image, bool readOnly, int& deviceFd) = 0;

    virtual int loopDetach(int index) = 0;

    // Drops a descriptor returned by loopAttach. With nothing else holding
    // the device, autoclear unbinds it.
    virtual int closeDevice(int deviceFd) = 0;
};

class LinuxSyscalls final : public Syscalls {
public:
    SourceKind sourceKind(const std::filesystem::path& source) override;
    int makeDirectories(const std::filesystem::path& dir) override;
    int mount(const std::string& source, const std::filesystem::path& target,
              const std::string& fsType, unsigned long flags, const std::string& data) override;
    int unmount(const std::filesystem::path& target, int flags) override;
    int loopFindFree(int& index) override;
    int loopAttach(int index, const std::filesystem::path& image, bool readOnly, int& deviceFd) override;
    int loopDetach(int index) override;
    int closeDevice(int deviceFd) override;
};

std::filesystem::path loopDevicePath(int index);

}
