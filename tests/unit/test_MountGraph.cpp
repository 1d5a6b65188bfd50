#include <gtest/gtest.h>
#include "mount/Graph.hpp"
#include "mount/Manager.hpp"
#include "config/Config.hpp"
#include "types/errors.hpp"
#include "fakes.hpp"

using namespace sfs::mount;
using namespace sfs::test;
using namespace std::chrono_literals;
using sfs::config::LayerConfig;

namespace {

LayerConfig layer(const std::string& name, const std::string& mp, const std::string& source = "") {
    return {
        .name = name,
        .source = source.empty() ? "/srv/" + name + ".img" : source,
        .mount_point = mp,
        .fs_type = "ext4",
        .options = {},
        .read_only = false
    };
}

}

class MountGraphTest : public ::testing::Test {
protected:
    FakeSyscalls sys;
    LoopAllocator loops{sys};
    Manager manager{sys, loops, UnmountPolicy{.retries = 1, .backoff = 1ms, .timeout = 0ms}};
};

TEST_F(MountGraphTest, EdgesFollowNearestAncestor) {
    const auto g = Graph::fromLayers({
        layer("root", "/mnt/root"),
        layer("a", "/mnt/root/a"),
        layer("b", "/mnt/root/a/b"),
        layer("c", "/mnt/root/c"),
    });

    const std::vector<std::pair<size_t, size_t>> expected{{0, 1}, {1, 2}, {0, 3}};
    EXPECT_EQ(g.edges(), expected);
    EXPECT_EQ(g.root(), 0u);
}

TEST_F(MountGraphTest, PrefixThatIsNotAPathComponentIsNotAnAncestor) {
    const auto g = Graph::fromLayers({
        layer("mnt", "/mnt"),
        layer("data", "/mnt/data"),
        layer("database", "/mnt/database"),
    });

    EXPECT_EQ(g.nodes()[2].parent, 0u);
}

TEST_F(MountGraphTest, DuplicateMountpointsAreRejected) {
    EXPECT_THROW(Graph::fromLayers({layer("a", "/mnt/x"), layer("b", "/mnt/x/")}), std::invalid_argument);
}

TEST_F(MountGraphTest, SecondRootIsRejected) {
    EXPECT_THROW(Graph::fromLayers({layer("a", "/mnt/a"), layer("b", "/mnt/b")}), std::invalid_argument);
}

TEST_F(MountGraphTest, EmptyGraphMountsNothing) {
    auto g = Graph::fromLayers({});
    EXPECT_TRUE(g.empty());
    g.mountAll(manager);
    EXPECT_TRUE(g.unmountAll(manager));
    EXPECT_TRUE(sys.calls.empty());
}

TEST_F(MountGraphTest, TopologicalOrderPutsParentsFirstWhateverTheListOrder) {
    const auto g = Graph::fromLayers({
        layer("deep", "/mnt/root/a/b"),
        layer("a", "/mnt/root/a"),
        layer("root", "/mnt/root"),
    });

    EXPECT_EQ(g.topologicalOrder(), (std::vector<size_t>{2, 1, 0}));
}

TEST_F(MountGraphTest, MountAllThenUnmountAllReversesOrder) {
    auto g = Graph::fromLayers({
        layer("root", "/mnt/root"),
        layer("a", "/mnt/root/a"),
        layer("b", "/mnt/root/b"),
    });

    g.mountAll(manager);
    EXPECT_EQ(g.mountedCount(), 3u);
    EXPECT_EQ(sys.callsStartingWith("mount"), (std::vector<std::string>{
        "mount /dev/loop0 /mnt/root", "mount /dev/loop1 /mnt/root/a", "mount /dev/loop2 /mnt/root/b"}));

    EXPECT_TRUE(g.unmountAll(manager));
    EXPECT_EQ(sys.callsStartingWith("umount"), (std::vector<std::string>{
        "umount /mnt/root/b", "umount /mnt/root/a", "umount /mnt/root"}));
    EXPECT_EQ(loops.allocatedCount(), 0u);
}

TEST_F(MountGraphTest, FailedMountUnwindsWhatWasMounted) {
    auto g = Graph::fromLayers({
        layer("root", "/mnt/root"),
        layer("a", "/mnt/root/a"),
        layer("b", "/mnt/root/b"),
    });
    sys.mountScript["/mnt/root/b"] = {EIO};

    EXPECT_THROW(g.mountAll(manager), sfs::types::MountOperationFailure);

    EXPECT_EQ(g.mountedCount(), 0u);
    EXPECT_EQ(sys.callsStartingWith("umount"), (std::vector<std::string>{"umount /mnt/root/a", "umount /mnt/root"}));
    EXPECT_EQ(loops.allocatedCount(), 0u);
}

TEST_F(MountGraphTest, StuckChildBlocksItsAncestorsOnly) {
    auto g = Graph::fromLayers({
        layer("root", "/mnt/root"),
        layer("busy", "/mnt/root/busy"),
        layer("fine", "/mnt/root/fine"),
    });
    g.mountAll(manager);
    sys.stickyUnmount["/mnt/root/busy"] = EBUSY;

    EXPECT_FALSE(g.unmountAll(manager));

    EXPECT_EQ(g.nodes()[0].state, MountState::Mounted);
    EXPECT_EQ(g.nodes()[1].state, MountState::Mounted);
    EXPECT_EQ(g.nodes()[2].state, MountState::Unmounted);
    for (const auto& call : sys.callsStartingWith("umount")) EXPECT_NE(call, "umount /mnt/root");
    EXPECT_EQ(g.mountedCount(), 2u);
}

TEST_F(MountGraphTest, ForcedUnmountAllDetachesEverything) {
    auto g = Graph::fromLayers({layer("root", "/mnt/root"), layer("a", "/mnt/root/a")});
    g.mountAll(manager);

    EXPECT_TRUE(g.unmountAll(manager, true));
    EXPECT_EQ(sys.callsStartingWith("detach"), (std::vector<std::string>{"detach /mnt/root/a", "detach /mnt/root"}));
}
