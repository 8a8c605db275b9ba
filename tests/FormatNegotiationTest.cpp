#include "capture/FormatNegotiation.hpp"
#include <gtest/gtest.h>
#include <vector>

using namespace roi_capture;

TEST(FormatNegotiationTest, FixedCandidateOrder) {
    auto formats = FormatCandidates();
    ASSERT_EQ(formats.size(), 3u);
    EXPECT_EQ(formats[0], PixelFormat::BGRA8);
    EXPECT_EQ(formats[1], PixelFormat::RGBA8);
    EXPECT_EQ(formats[2], PixelFormat::RGBA_F16);
}

TEST(FormatNegotiationTest, FirstAcceptedWinsAndStopsTrying) {
    std::vector<PixelFormat> tried;
    PixelFormat chosen = PixelFormat::Unknown;
    HResult h = NegotiateFormat(FormatCandidates(),
        [&](PixelFormat f) {
            tried.push_back(f);
            return f == PixelFormat::RGBA8 ? hr::Ok : hr::Unsupported;
        },
        chosen);

    EXPECT_TRUE(hr::Succeeded(h));
    EXPECT_EQ(chosen, PixelFormat::RGBA8);
    EXPECT_EQ(tried, (std::vector<PixelFormat>{ PixelFormat::BGRA8, PixelFormat::RGBA8 }));
}

TEST(FormatNegotiationTest, NoneAcceptedReturnsLastFailure) {
    PixelFormat chosen = PixelFormat::BGRA8;
    int calls = 0;
    HResult h = NegotiateFormat(FormatCandidates(),
        [&](PixelFormat) { return ++calls == 3 ? hr::InvalidArg : hr::Unsupported; },
        chosen);

    EXPECT_EQ(h, hr::InvalidArg);
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(chosen, PixelFormat::Unknown);
}

TEST(FormatNegotiationTest, EmptyListIsUnsupported) {
    PixelFormat chosen = PixelFormat::BGRA8;
    HResult h = NegotiateFormat({}, [](PixelFormat) { return hr::Ok; }, chosen);
    EXPECT_EQ(h, hr::Unsupported);
    EXPECT_EQ(chosen, PixelFormat::Unknown);
}
