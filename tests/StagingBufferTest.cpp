#include "capture/StagingBuffer.hpp"
#include "FakeCaptureBackend.hpp"
#include <gtest/gtest.h>

using namespace roi_capture;
using namespace roi_capture::fakes;

class StagingBufferTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeState> state = std::make_shared<FakeState>();
    FakeSession session{ state, PixelFormat::BGRA8 };
    StagingBuffer staging;
    CaptureError err;
};

TEST_F(StagingBufferTest, ReusesSurfaceForSameSize) {
    ASSERT_EQ(staging.Ensure(&session, 64, 32, err), CaptureResult::Success);
    IStagingSurface* first = staging.Surface();
    ASSERT_EQ(staging.Ensure(&session, 64, 32, err), CaptureResult::Success);

    EXPECT_EQ(staging.Surface(), first);
    EXPECT_EQ(staging.AllocationCount(), 1u);
    EXPECT_EQ(state->allocations, 1);
    EXPECT_TRUE(staging.Matches(64, 32));
}

TEST_F(StagingBufferTest, ReallocatesOnSizeChange) {
    ASSERT_EQ(staging.Ensure(&session, 64, 32, err), CaptureResult::Success);
    ASSERT_EQ(staging.Ensure(&session, 32, 64, err), CaptureResult::Success);

    EXPECT_EQ(staging.AllocationCount(), 2u);
    EXPECT_EQ(state->liveSurfaces, 1);
    EXPECT_EQ(staging.Width(), 32u);
    EXPECT_EQ(staging.Height(), 64u);
}

TEST_F(StagingBufferTest, ResetForgetsCachedSize) {
    ASSERT_EQ(staging.Ensure(&session, 16, 16, err), CaptureResult::Success);
    staging.Reset();

    EXPECT_FALSE(staging.Matches(16, 16));
    EXPECT_EQ(staging.Surface(), nullptr);
    EXPECT_EQ(state->liveSurfaces, 0);

    ASSERT_EQ(staging.Ensure(&session, 16, 16, err), CaptureResult::Success);
    EXPECT_EQ(staging.AllocationCount(), 2u);
}

TEST_F(StagingBufferTest, RejectsMissingSessionAndEmptySize) {
    EXPECT_EQ(staging.Ensure(nullptr, 16, 16, err), CaptureResult::AllocationError);
    EXPECT_EQ(staging.Ensure(&session, 0, 16, err), CaptureResult::AllocationError);
    EXPECT_EQ(err.nativeCode, hr::InvalidArg);
    EXPECT_EQ(state->allocations, 0);
}

TEST_F(StagingBufferTest, BackendRefusalIsAllocationError) {
    state->allocResult = hr::OutOfMemory;
    EXPECT_EQ(staging.Ensure(&session, 16, 16, err), CaptureResult::AllocationError);
    EXPECT_EQ(err.nativeCode, hr::OutOfMemory);
    EXPECT_EQ(staging.Surface(), nullptr);
    EXPECT_FALSE(staging.Matches(16, 16));
}
