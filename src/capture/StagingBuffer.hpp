#pragma once
#include "CaptureBackend.hpp"
#include <cstdint>
#include <memory>

namespace roi_capture {

    // CPU-readable surface sized to the last requested region; reused while the size is unchanged.
    class StagingBuffer {
    public:
        // No-op when a surface of exactly width x height exists, otherwise reallocates.
        CaptureResult Ensure(IDuplicationSession* session, std::uint32_t width, std::uint32_t height, CaptureError& err);

        // Drops the surface and forgets the cached size (session replaced or torn down).
        void Reset();

        bool Matches(std::uint32_t width, std::uint32_t height) const {
            return surface_ && width_ == width && height_ == height;
        }
        IStagingSurface* Surface() const { return surface_.get(); }
        std::uint32_t Width() const { return width_; }
        std::uint32_t Height() const { return height_; }
        std::uint64_t AllocationCount() const { return allocations_; }

    private:
        std::unique_ptr<IStagingSurface> surface_;
        std::uint32_t width_ = 0;
        std::uint32_t height_ = 0;
        std::uint64_t allocations_ = 0;
    };

} // namespace roi_capture
