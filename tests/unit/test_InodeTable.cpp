#include <gtest/gtest.h>
#include "fuse/InodeTable.hpp"

using namespace sfs::fuse;

TEST(InodeTableTest, RootResolvesToSlash) {
    InodeTable t;
    ASSERT_TRUE(t.resolve(FUSE_ROOT_ID).has_value());
    EXPECT_EQ(*t.resolve(FUSE_ROOT_ID), "/");
}

TEST(InodeTableTest, LookupIsStablePerPath) {
    InodeTable t;
    const auto a = t.lookup("/a.txt");
    const auto b = t.lookup("/b.txt");

    EXPECT_NE(a, b);
    EXPECT_EQ(t.lookup("/a.txt"), a);
    EXPECT_EQ(*t.resolve(a), "/a.txt");
    EXPECT_EQ(t.find("/b.txt"), b);
}

TEST(InodeTableTest, ForgetEvictsOnceAllLookupsAreReturned) {
    InodeTable t;
    const auto a = t.lookup("/a.txt");
    t.lookup("/a.txt");

    t.forget(a, 1);
    EXPECT_TRUE(t.resolve(a).has_value());

    t.forget(a, 1);
    EXPECT_FALSE(t.resolve(a).has_value());
    EXPECT_FALSE(t.find("/a.txt").has_value());
}

TEST(InodeTableTest, OpenHandleKeepsInodeAlive) {
    InodeTable t;
    const auto a = t.lookup("/a.txt");
    t.pinOpen(a);

    t.forget(a, 1);
    EXPECT_TRUE(t.resolve(a).has_value());

    t.unpinOpen(a);
    EXPECT_FALSE(t.resolve(a).has_value());
}

TEST(InodeTableTest, RenameMovesSubtree) {
    InodeTable t;
    const auto dir = t.lookup("/docs");
    const auto file = t.lookup("/docs/report.txt");
    const auto sibling = t.lookup("/docs2/keep.txt");

    t.rename("/docs", "/archive");

    EXPECT_EQ(*t.resolve(dir), "/archive");
    EXPECT_EQ(*t.resolve(file), "/archive/report.txt");
    EXPECT_EQ(*t.resolve(sibling), "/docs2/keep.txt");
    EXPECT_FALSE(t.find("/docs/report.txt").has_value());
}

TEST(InodeTableTest, RenameOverExistingTargetDetachesIt) {
    InodeTable t;
    const auto from = t.lookup("/new.txt");
    const auto victim = t.lookup("/old.txt");

    t.rename("/new.txt", "/old.txt");

    EXPECT_EQ(t.find("/old.txt"), from);
    EXPECT_FALSE(t.resolve(victim).has_value());
}

TEST(InodeTableTest, RemoveDetachesPathButKeepsOpenInode) {
    InodeTable t;
    const auto a = t.lookup("/a.txt");
    t.pinOpen(a);

    t.remove("/a.txt");
    EXPECT_FALSE(t.resolve(a).has_value());
    EXPECT_FALSE(t.find("/a.txt").has_value());

    // A new file under the same name gets a fresh inode.
    EXPECT_NE(t.lookup("/a.txt"), a);
}
