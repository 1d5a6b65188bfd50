#include "mount/Syscalls.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <linux/loop.h>
#include <sys/ioctl.h>
#include <sys/mount.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sfs::mount {

namespace {

struct Fd {
    int fd;
    explicit Fd(const int f) : fd(f) {}
    ~Fd() { if (fd >= 0) ::close(fd); }
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
};

}

std::filesystem::path loopDevicePath(const int index) {
    return "/dev/loop" + std::to_string(index);
}

SourceKind LinuxSyscalls::sourceKind(const std::filesystem::path& source) {
    struct stat st{};
    if (::stat(source.c_str(), &st) != 0) return SourceKind::Missing;
    if (S_ISBLK(st.st_mode)) return SourceKind::BlockDevice;
    if (S_ISDIR(st.st_mode)) return SourceKind::Directory;
    if (S_ISREG(st.st_mode)) return SourceKind::Image;
    return SourceKind::Missing;
}

int LinuxSyscalls::makeDirectories(const std::filesystem::path& dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    return ec ? ec.value() : 0;
}

int LinuxSyscalls::mount(const std::string& source, const std::filesystem::path& target,
                         const std::string& fsType, const unsigned long flags, const std::string& data) {
    const int rc = ::mount(source.c_str(), target.c_str(),
                           fsType.empty() ? nullptr : fsType.c_str(), flags,
                           data.empty() ? nullptr : data.c_str());
    return rc == 0 ? 0 : errno;
}

int LinuxSyscalls::unmount(const std::filesystem::path& target, const int flags) {
    return ::umount2(target.c_str(), flags) == 0 ? 0 : errno;
}

int LinuxSyscalls::loopFindFree(int& index) {
    const Fd ctl(::open("/dev/loop-control", O_RDWR | O_CLOEXEC));
    if (ctl.fd < 0) return errno;

    const int rc = ::ioctl(ctl.fd, LOOP_CTL_GET_FREE);
    if (rc < 0) return errno;

    index = rc;
    return 0;
}

int LinuxSyscalls::loopAttach(const int index, const std::filesystem::path& image, const bool readOnly, int& deviceFd) {
    const Fd backing(::open(image.c_str(), (readOnly ? O_RDONLY : O_RDWR) | O_CLOEXEC));
    if (backing.fd < 0) return errno;

    Fd loop(::open(loopDevicePath(index).c_str(), (readOnly ? O_RDONLY : O_RDWR) | O_CLOEXEC));
    if (loop.fd < 0) return errno;

    if (::ioctl(loop.fd, LOOP_SET_FD, backing.fd) < 0) return errno;

    loop_info64 info{};
    info.lo_flags = LO_FLAGS_AUTOCLEAR | (readOnly ? LO_FLAGS_READ_ONLY : 0);
    std::strncpy(reinterpret_cast<char*>(info.lo_file_name), image.c_str(), LO_NAME_SIZE - 1);

    if (::ioctl(loop.fd, LOOP_SET_STATUS64, &info) < 0) {
        const int err = errno;
        (void)::ioctl(loop.fd, LOOP_CLR_FD, 0);  // the status error is the one reported
        return err;
    }

    // Autoclear unbinds on the last close, so this descriptor must outlive the mount(2).
    deviceFd = loop.fd;
    loop.fd = -1;
    return 0;
}

int LinuxSyscalls::loopDetach(const int index) {
    const Fd loop(::open(loopDevicePath(index).c_str(), O_RDONLY | O_CLOEXEC));
    if (loop.fd < 0) return errno;
    return ::ioctl(loop.fd, LOOP_CLR_FD, 0) == 0 ? 0 : errno;
}

int LinuxSyscalls::closeDevice(const int deviceFd) {
    if (deviceFd < 0) return 0;
    return ::close(deviceFd) == 0 ? 0 : errno;
}

}
