#pragma once
#include "CaptureBackend.hpp"
#include "StagingBuffer.hpp"
#include "../config/Config.hpp"
#include "../image/ImageBuffer.hpp"
#include <cstdint>
#include <memory>

namespace roi_capture {

    // Extracts sub-rectangles of the duplicated output, rebuilding the session after device loss.
    // Construction only stores the backend and config; the first Initialize() (explicit, or run by
    // the first CaptureRegion) opens the session. Output size and format read 0/Unknown until then.
    // Not thread-safe: callers serialize every call on one owner.
    class RegionCapture {
    public:
        explicit RegionCapture(std::unique_ptr<ICaptureBackend> backend, CaptureConfig cfg = {});
        ~RegionCapture();

        RegionCapture(const RegionCapture&) = delete;
        RegionCapture& operator=(const RegionCapture&) = delete;

        // Tears down any previous session, then builds a new one.
        CaptureResult Initialize();

        // Releases session and staging surface. Safe to call repeatedly.
        void Shutdown();

        // Fills `out` with width * height * 4 packed bytes, rows top to bottom.
        // Opens a session first when none is live, so bounds are always those of the current output.
        // A poll with no new frame succeeds with a zero-filled buffer.
        CaptureResult CaptureRegion(std::uint32_t left, std::uint32_t top,
            std::uint32_t width, std::uint32_t height, ImageBuffer& out);

        bool IsInitialized() const { return session_ != nullptr; }
        std::uint32_t OutputWidth() const { return output_.width; }
        std::uint32_t OutputHeight() const { return output_.height; }
        bool IsHDREnabled() const { return output_.hdrEnabled; }
        HDRMetadata GetHDRMetadata() const { return output_.hdr; }
        PixelFormat SurfaceFormat() const { return format_; }
        PixelFormat OutputPixelFormat() const;
        std::uint64_t StagingAllocationCount() const { return staging_.AllocationCount(); }
        const CaptureError& LastError() const { return lastError_; }
        const CaptureConfig& Config() const { return cfg_; }

    private:
        CaptureResult fail(CaptureResult r, HResult code, std::wstring message);
        CaptureResult acquireAndCopy(const Region& region, bool& gotFrame);
        CaptureResult recoverFromDeviceLoss(const Region& region, HResult cause);
        CaptureResult readback(const Region& region, ImageBuffer& out);

        std::unique_ptr<ICaptureBackend> backend_;
        CaptureConfig cfg_;

        std::unique_ptr<IDuplicationSession> session_;
        OutputDesc output_{};
        PixelFormat format_ = PixelFormat::Unknown;
        StagingBuffer staging_;
        CaptureError lastError_{};
    };

} // namespace roi_capture
