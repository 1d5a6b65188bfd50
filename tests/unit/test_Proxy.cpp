#include <gtest/gtest.h>
#include "fuse/Proxy.hpp"
#include "scan/VerdictCache.hpp"
#include "log/Registry.hpp"
#include "fakes.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <cstdio>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>

using namespace sfs::fuse;
using namespace sfs::scan;
using namespace sfs::test;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

class ProxyTest : public ::testing::Test {
protected:
    fs::path root;
    FakeScanner::Shared shared;
    FakeScanner scanner{shared};
    std::atomic<bool> draining{false};
    std::unique_ptr<VerdictCache> cache;
    std::unique_ptr<Proxy> proxy;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> audit;

    void SetUp() override {
        root = fs::temp_directory_path() / ("sentryfs-proxy-" + std::to_string(::getpid()) + "-" +
               ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(root);
        fs::create_directories(root);
        root = fs::canonical(root);

        cache = std::make_unique<VerdictCache>([this](const ByteSource& src) { return scanner.scan(src); }, 64);
        proxy = std::make_unique<Proxy>(ProxyOptions{.sourceRoot = root}, *cache, draining);

        audit = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(16);
        sfs::log::Registry::audit()->sinks().push_back(audit);
    }

    void TearDown() override {
        auto& sinks = sfs::log::Registry::audit()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), audit), sinks.end());
        proxy.reset();
        cache.reset();
        fs::remove_all(root);
    }

    void put(const std::string& rel, const std::string& content) const {
        std::ofstream(root / rel, std::ios::binary | std::ios::trunc) << content;
    }

    static std::string slurpFile(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    fuse_ino_t lookup(const std::string& name, const fuse_ino_t parent = FUSE_ROOT_ID) const {
        fuse_entry_param e{};
        EXPECT_EQ(proxy->lookup(parent, name, e), 0) << name;
        return e.ino;
    }

    std::string readAll(const uint64_t fh) const {
        std::vector<char> buf;
        EXPECT_EQ(proxy->read(fh, 1 << 16, 0, buf), 0);
        return {buf.begin(), buf.end()};
    }
};

TEST_F(ProxyTest, CleanFileIsServedAndVerdictReused) {
    put("report.txt", "quarterly numbers");
    const auto ino = lookup("report.txt");

    uint64_t fh = 0;
    ASSERT_EQ(proxy->open(ino, O_RDONLY, fh), 0);
    EXPECT_EQ(readAll(fh), "quarterly numbers");
    EXPECT_EQ(proxy->release(fh), 0);

    ASSERT_EQ(proxy->open(ino, O_RDONLY, fh), 0);
    EXPECT_EQ(proxy->release(fh), 0);

    EXPECT_EQ(shared.calls.load(), 1);
    EXPECT_EQ(cache->stats().hits, 1u);
    EXPECT_EQ(proxy->openHandles(), 0u);
}

TEST_F(ProxyTest, InfectedFileIsDeniedAndAudited) {
    put("doc.txt", std::string("invoice ") + INFECTED_MARKER);
    const auto ino = lookup("doc.txt");

    uint64_t fh = 0;
    EXPECT_EQ(proxy->open(ino, O_RDONLY, fh), EACCES);
    EXPECT_EQ(proxy->open(ino, O_RDWR, fh), EACCES);
    EXPECT_EQ(proxy->openHandles(), 0u);
    EXPECT_EQ(shared.calls.load(), 1);

    const auto records = audit->last_formatted();
    ASSERT_FALSE(records.empty());
    EXPECT_NE(records.back().find("doc.txt"), std::string::npos);
    EXPECT_NE(records.back().find("Test.Signature"), std::string::npos);

    // Metadata stays visible; only content is gated.
    struct stat st{};
    EXPECT_EQ(proxy->getattr(ino, st), 0);
}

TEST_F(ProxyTest, ScanFailureIsEIOAndRetriedNextTime) {
    put("a.txt", "fine");
    const auto ino = lookup("a.txt");
    shared.throwOnScan = true;

    uint64_t fh = 0;
    EXPECT_EQ(proxy->open(ino, O_RDONLY, fh), EIO);

    shared.throwOnScan = false;
    ASSERT_EQ(proxy->open(ino, O_RDONLY, fh), 0);
    proxy->release(fh);
    EXPECT_EQ(shared.calls.load(), 2);
}

TEST_F(ProxyTest, DrainingRefusesNewOpens) {
    put("a.txt", "fine");
    const auto ino = lookup("a.txt");
    draining = true;

    uint64_t fh = 0;
    fuse_entry_param e{};
    EXPECT_EQ(proxy->open(ino, O_RDONLY, fh), EBUSY);
    EXPECT_EQ(proxy->create(FUSE_ROOT_ID, "b.txt", 0644, O_WRONLY, e, fh), EBUSY);
    EXPECT_EQ(shared.calls.load(), 0);
}

TEST_F(ProxyTest, ConcurrentOpensOfOneFileScanOnce) {
    put("hot.bin", "shared content");
    const auto ino = lookup("hot.bin");
    shared.delay = 100ms;

    std::vector<std::future<std::pair<int, uint64_t>>> opens;
    for (int i = 0; i < 8; ++i) {
        opens.push_back(std::async(std::launch::async, [&] {
            uint64_t fh = 0;
            const int rc = proxy->open(ino, O_RDONLY, fh);
            return std::make_pair(rc, fh);
        }));
    }

    for (auto& f : opens) {
        const auto [rc, fh] = f.get();
        EXPECT_EQ(rc, 0);
        if (rc == 0) proxy->release(fh);
    }
    EXPECT_EQ(shared.calls.load(), 1);
}

TEST_F(ProxyTest, WriteOnlyOpenIsNotScannedButReleaseIs) {
    put("upload.bin", "old");
    const auto ino = lookup("upload.bin");

    uint64_t fh = 0;
    ASSERT_EQ(proxy->open(ino, O_WRONLY | O_TRUNC, fh), 0);
    EXPECT_EQ(shared.calls.load(), 0);

    const std::string payload = std::string("dropper ") + INFECTED_MARKER;
    size_t written = 0;
    ASSERT_EQ(proxy->write(fh, payload.data(), payload.size(), 0, written), 0);
    EXPECT_EQ(written, payload.size());

    EXPECT_EQ(proxy->release(fh), EACCES);
    EXPECT_EQ(shared.calls.load(), 1);
    EXPECT_FALSE(fs::exists(root / "upload.bin"));
    EXPECT_FALSE(proxy->inodes().resolve(ino).has_value());
}

TEST_F(ProxyTest, CreatedCleanFileIsScannedOnceAtRelease) {
    fuse_entry_param e{};
    uint64_t fh = 0;
    ASSERT_EQ(proxy->create(FUSE_ROOT_ID, "notes.txt", 0644, O_WRONLY | O_CREAT, e, fh), 0);

    const std::string text = "meeting at noon";
    size_t written = 0;
    ASSERT_EQ(proxy->write(fh, text.data(), text.size(), 0, written), 0);
    EXPECT_EQ(proxy->release(fh), 0);
    EXPECT_EQ(shared.calls.load(), 1);
    EXPECT_EQ(slurpFile(root / "notes.txt"), text);

    // The verdict recorded at release serves the next reader.
    ASSERT_EQ(proxy->open(e.ino, O_RDONLY, fh), 0);
    EXPECT_EQ(readAll(fh), text);
    proxy->release(fh);
    EXPECT_EQ(shared.calls.load(), 1);
}

TEST_F(ProxyTest, WriteThroughHandleInvalidatesEarlierVerdict) {
    put("a.txt", "clean start");
    const auto ino = lookup("a.txt");

    uint64_t fh = 0;
    ASSERT_EQ(proxy->open(ino, O_RDWR, fh), 0);
    EXPECT_TRUE(cache->peek(proxy->realPath("/a.txt")).has_value());

    const std::string payload = INFECTED_MARKER;
    size_t written = 0;
    ASSERT_EQ(proxy->write(fh, payload.data(), payload.size(), 0, written), 0);
    EXPECT_FALSE(cache->peek(proxy->realPath("/a.txt")).has_value());

    EXPECT_EQ(proxy->release(fh), EACCES);
    EXPECT_EQ(shared.calls.load(), 2);
    EXPECT_FALSE(fs::exists(root / "a.txt"));
}

TEST_F(ProxyTest, ChangeMadeBehindTheProxyIsRescanned) {
    put("a.txt", "v1");
    const auto ino = lookup("a.txt");

    uint64_t fh = 0;
    ASSERT_EQ(proxy->open(ino, O_RDONLY, fh), 0);
    proxy->release(fh);

    put("a.txt", std::string("v2 ") + INFECTED_MARKER);
    EXPECT_EQ(proxy->open(ino, O_RDONLY, fh), EACCES);
    EXPECT_EQ(shared.calls.load(), 2);
}

TEST_F(ProxyTest, TruncateViaSetattrDropsVerdict) {
    put("a.txt", "some bytes");
    const auto ino = lookup("a.txt");

    uint64_t fh = 0;
    ASSERT_EQ(proxy->open(ino, O_RDONLY, fh), 0);
    proxy->release(fh);
    ASSERT_TRUE(cache->peek(proxy->realPath("/a.txt")).has_value());

    struct stat attr{};
    attr.st_size = 0;
    struct stat out{};
    ASSERT_EQ(proxy->setattr(ino, attr, FUSE_SET_ATTR_SIZE, nullptr, out), 0);
    EXPECT_EQ(out.st_size, 0);
    EXPECT_FALSE(cache->peek(proxy->realPath("/a.txt")).has_value());
}

TEST_F(ProxyTest, RenameMovesInodeAndInvalidatesBothNames) {
    put("a.txt", "alpha");
    const auto ino = lookup("a.txt");

    uint64_t fh = 0;
    ASSERT_EQ(proxy->open(ino, O_RDONLY, fh), 0);
    proxy->release(fh);

    ASSERT_EQ(proxy->rename(FUSE_ROOT_ID, "a.txt", FUSE_ROOT_ID, "b.txt", 0), 0);
    EXPECT_FALSE(cache->peek(proxy->realPath("/a.txt")).has_value());
    EXPECT_EQ(*proxy->inodes().resolve(ino), "/b.txt");
    EXPECT_EQ(slurpFile(root / "b.txt"), "alpha");

    EXPECT_EQ(proxy->rename(FUSE_ROOT_ID, "b.txt", FUSE_ROOT_ID, "c.txt", RENAME_EXCHANGE), EINVAL);
}

TEST_F(ProxyTest, WriteAfterRenameInvalidatesTheNewName) {
    put("a.txt", "alpha");

    uint64_t writer = 0;
    ASSERT_EQ(proxy->open(lookup("a.txt"), O_RDWR, writer), 0);

    // Attribute calls read the handle's path while renames move it.
    auto renamer = std::async(std::launch::async, [&] {
        for (int i = 0; i < 100; ++i) {
            EXPECT_EQ(proxy->rename(FUSE_ROOT_ID, "a.txt", FUSE_ROOT_ID, "b.txt", 0), 0);
            EXPECT_EQ(proxy->rename(FUSE_ROOT_ID, "b.txt", FUSE_ROOT_ID, "a.txt", 0), 0);
        }
    });
    for (int i = 0; i < 200; ++i) {
        struct stat attr{};
        struct stat out{};
        EXPECT_EQ(proxy->setattr(0, attr, FUSE_SET_ATTR_ATIME_NOW, &writer, out), 0);
    }
    renamer.get();

    ASSERT_EQ(proxy->rename(FUSE_ROOT_ID, "a.txt", FUSE_ROOT_ID, "b.txt", 0), 0);

    uint64_t reader = 0;
    ASSERT_EQ(proxy->open(lookup("b.txt"), O_RDONLY, reader), 0);
    proxy->release(reader);
    ASSERT_TRUE(cache->peek(proxy->realPath("/b.txt")).has_value());

    size_t written = 0;
    ASSERT_EQ(proxy->write(writer, "!", 1, 5, written), 0);
    EXPECT_FALSE(cache->peek(proxy->realPath("/b.txt")).has_value());

    EXPECT_EQ(proxy->release(writer), 0);
    EXPECT_EQ(slurpFile(root / "b.txt"), "alpha!");
}

TEST_F(ProxyTest, OpenHandleOutlivesUnlink) {
    fuse_entry_param e{};
    uint64_t fh = 0;
    ASSERT_EQ(proxy->create(FUSE_ROOT_ID, "scratch.tmp", 0600, O_RDWR | O_CREAT, e, fh), 0);

    size_t written = 0;
    ASSERT_EQ(proxy->write(fh, "scratch data", 12, 0, written), 0);
    ASSERT_EQ(proxy->unlink(FUSE_ROOT_ID, "scratch.tmp"), 0);
    ASSERT_FALSE(fs::exists(root / "scratch.tmp"));

    struct stat st{};
    EXPECT_EQ(proxy->getattr(e.ino, st), ENOENT);
    ASSERT_EQ(proxy->getattr(e.ino, st, &fh), 0);
    EXPECT_EQ(st.st_size, 12);
    EXPECT_EQ(st.st_ino, e.ino);

    struct stat attr{};
    attr.st_size = 7;
    attr.st_mode = S_IFREG | 0640;
    struct stat out{};
    ASSERT_EQ(proxy->setattr(e.ino, attr, FUSE_SET_ATTR_SIZE | FUSE_SET_ATTR_MODE | FUSE_SET_ATTR_MTIME_NOW, &fh, out), 0);
    EXPECT_EQ(out.st_size, 7);
    EXPECT_EQ(out.st_mode & 0777, 0640u);

    std::vector<char> buf;
    ASSERT_EQ(proxy->read(fh, 64, 0, buf), 0);
    EXPECT_EQ(std::string(buf.begin(), buf.end()), "scratch");

    EXPECT_EQ(proxy->release(fh), 0);
    EXPECT_EQ(shared.calls.load(), 0);
}

TEST_F(ProxyTest, NamespaceOperationsPassThrough) {
    put("keep.txt", "1234567");

    fuse_entry_param e{};
    ASSERT_EQ(proxy->mkdir(FUSE_ROOT_ID, "dir", 0755, e), 0);
    EXPECT_TRUE(fs::is_directory(root / "dir"));
    const auto dirIno = e.ino;

    uint64_t fh = 0;
    ASSERT_EQ(proxy->create(dirIno, "inner.txt", 0600, O_WRONLY | O_CREAT, e, fh), 0);
    EXPECT_EQ(proxy->release(fh), 0);
    EXPECT_TRUE(fs::exists(root / "dir" / "inner.txt"));

    std::vector<DirEntry> entries;
    ASSERT_EQ(proxy->readdir(FUSE_ROOT_ID, entries), 0);
    std::vector<std::string> names;
    for (const auto& d : entries) names.push_back(d.name);
    EXPECT_NE(std::ranges::find(names, "keep.txt"), names.end());
    EXPECT_NE(std::ranges::find(names, "dir"), names.end());

    struct stat st{};
    ASSERT_EQ(proxy->getattr(lookup("keep.txt"), st), 0);
    EXPECT_EQ(st.st_size, 7);

    EXPECT_EQ(proxy->rmdir(FUSE_ROOT_ID, "dir"), ENOTEMPTY);
    EXPECT_EQ(proxy->unlink(dirIno, "inner.txt"), 0);
    EXPECT_EQ(proxy->rmdir(FUSE_ROOT_ID, "dir"), 0);
    EXPECT_FALSE(fs::exists(root / "dir"));

    EXPECT_EQ(proxy->lookup(FUSE_ROOT_ID, "missing", e), ENOENT);

    struct statvfs vfs{};
    EXPECT_EQ(proxy->statfs(FUSE_ROOT_ID, vfs), 0);
}

TEST_F(ProxyTest, SymlinkIsReadBack) {
    fs::create_symlink("keep.txt", root / "link");
    const auto ino = lookup("link");

    std::string target;
    ASSERT_EQ(proxy->readlink(ino, target), 0);
    EXPECT_EQ(target, "keep.txt");
}

TEST_F(ProxyTest, CloseAllDropsEveryHandle) {
    put("a.txt", "x");
    put("b.txt", "y");

    uint64_t fh = 0;
    ASSERT_EQ(proxy->open(lookup("a.txt"), O_RDONLY, fh), 0);
    ASSERT_EQ(proxy->open(lookup("b.txt"), O_RDONLY, fh), 0);

    EXPECT_EQ(proxy->closeAll(), 2u);
    EXPECT_EQ(proxy->openHandles(), 0u);
    EXPECT_EQ(proxy->release(fh), EBADF);
}
