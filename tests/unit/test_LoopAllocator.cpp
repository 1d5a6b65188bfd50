#include <gtest/gtest.h>
#include "mount/LoopAllocator.hpp"
#include "types/errors.hpp"
#include "fakes.hpp"

using namespace sfs::mount;
using namespace sfs::test;
using sfs::types::MountOperationFailure;

TEST(LoopAllocatorTest, AcquireAttachesAndReleaseDetaches) {
    FakeSyscalls sys;
    LoopAllocator loops(sys);

    const auto slot = loops.acquire("/srv/data.img", true);
    EXPECT_EQ(slot.index, 0);
    EXPECT_EQ(slot.device, "/dev/loop0");
    EXPECT_TRUE(slot.readOnly);
    EXPECT_EQ(loops.allocatedCount(), 1u);
    EXPECT_EQ(sys.callsStartingWith("attach"), std::vector<std::string>{"attach loop0 /srv/data.img ro"});

    loops.release(slot);
    EXPECT_EQ(loops.allocatedCount(), 0u);
    EXPECT_EQ(sys.callsStartingWith("release").size(), 1u);
}

TEST(LoopAllocatorTest, RetriesWhenDeviceIsTakenBeforeAttach) {
    FakeSyscalls sys;
    sys.attachScript = {EBUSY, EBUSY};
    LoopAllocator loops(sys);

    const auto slot = loops.acquire("/srv/data.img", false);
    EXPECT_EQ(slot.index, 2);
    EXPECT_EQ(sys.callsStartingWith("attach").size(), 3u);
}

TEST(LoopAllocatorTest, GivesUpAfterConfiguredAttempts) {
    FakeSyscalls sys;
    sys.attachScript = {EBUSY, EBUSY, EBUSY};
    LoopAllocator loops(sys, 3);

    try {
        loops.acquire("/srv/data.img", false);
        FAIL() << "expected MountOperationFailure";
    } catch (const MountOperationFailure& e) {
        EXPECT_EQ(e.error(), EBUSY);
    }
    EXPECT_EQ(loops.allocatedCount(), 0u);
}

TEST(LoopAllocatorTest, NoFreeDeviceFailsImmediately) {
    FakeSyscalls sys;
    sys.findFreeError = ENOSPC;
    LoopAllocator loops(sys);

    EXPECT_THROW(loops.acquire("/srv/data.img", false), MountOperationFailure);
    EXPECT_TRUE(sys.callsStartingWith("attach").empty());
}

TEST(LoopAllocatorTest, AlreadyDetachedDeviceCountsAsReleased) {
    FakeSyscalls sys;
    sys.detachScript = {ENXIO};
    LoopAllocator loops(sys);

    const auto slot = loops.acquire("/srv/data.img", false);
    EXPECT_NO_THROW(loops.release(slot));
    EXPECT_EQ(loops.allocatedCount(), 0u);
}

TEST(LoopAllocatorTest, RefusedDetachKeepsSlotAllocated) {
    FakeSyscalls sys;
    sys.detachScript = {EBUSY};
    LoopAllocator loops(sys);

    const auto slot = loops.acquire("/srv/data.img", false);
    EXPECT_THROW(loops.release(slot), MountOperationFailure);
    EXPECT_EQ(loops.allocatedCount(), 1u);

    loops.release(slot);
    EXPECT_EQ(loops.allocatedCount(), 0u);
}

TEST(LoopAllocatorTest, DistinctImagesGetDistinctDevices) {
    FakeSyscalls sys;
    LoopAllocator loops(sys);

    const auto a = loops.acquire("/srv/a.img", false);
    const auto b = loops.acquire("/srv/b.img", false);
    EXPECT_NE(a.index, b.index);
    EXPECT_EQ(loops.allocated().size(), 2u);
}

TEST(LoopAllocatorTest, DeviceStaysBoundUntilRelease) {
    FakeSyscalls sys;
    LoopAllocator loops(sys);

    const auto slot = loops.acquire("/srv/data.img", false);
    EXPECT_GE(slot.deviceFd, 0);
    EXPECT_TRUE(sys.isBound(slot.index));
    EXPECT_EQ(sys.openDeviceCount(), 1u);

    loops.release(slot);
    EXPECT_FALSE(sys.isBound(slot.index));
    EXPECT_EQ(sys.openDeviceCount(), 0u);
    EXPECT_EQ(sys.callsStartingWith("close"), std::vector<std::string>{"close loop0"});
}

TEST(LoopAllocatorTest, UnreleasedSlotsAreClosedOnDestruction) {
    FakeSyscalls sys;
    int index = -1;
    {
        LoopAllocator loops(sys);
        index = loops.acquire("/srv/data.img", false).index;
        ASSERT_TRUE(sys.isBound(index));
    }
    EXPECT_EQ(sys.openDeviceCount(), 0u);
    EXPECT_FALSE(sys.isBound(index));
}
