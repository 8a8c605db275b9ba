#pragma once
#include "CaptureCommon.hpp"
#include "../image/ImageBuffer.hpp"
#include "../config/Config.hpp"
#include <cstdint>
#include <memory>

namespace roi_capture {

    // CPU-readable GPU surface created by a session. Owned by the caller, released on destruction.
    class IStagingSurface {
    public:
        virtual ~IStagingSurface() = default;
        virtual std::uint32_t Width() const = 0;
        virtual std::uint32_t Height() const = 0;
        virtual bool IsValid() const = 0;
    };

    struct MappedSurface {
        const std::uint8_t* data = nullptr;
        std::uint32_t rowPitch = 0;   // may exceed Width() * bytes per pixel
    };

    // One live (device, context, output, duplication) bundle. Destroying it releases every handle.
    class IDuplicationSession {
    public:
        virtual ~IDuplicationSession() = default;

        virtual const OutputDesc& Output() const = 0;
        virtual PixelFormat Format() const = 0;

        // hasFrame is false when the call succeeded without handing out a frame resource.
        // A successful call must always be paired with ReleaseFrame().
        virtual HResult AcquireNextFrame(std::uint32_t timeoutMs, bool& hasFrame) = 0;
        virtual HResult ReleaseFrame() = 0;

        virtual HResult CreateStagingSurface(std::uint32_t width, std::uint32_t height,
            std::unique_ptr<IStagingSurface>& out) = 0;

        // Copies `src` of the currently acquired frame to (0,0) of `dst`.
        virtual HResult CopyFrameRegion(IStagingSurface& dst, const Region& src) = 0;

        virtual HResult Map(IStagingSurface& surface, MappedSurface& out) = 0;
        virtual void Unmap(IStagingSurface& surface) = 0;
    };

    class ICaptureBackend {
    public:
        virtual ~ICaptureBackend() = default;

        // Returns Success and a fully initialized session, DeviceInitError or DuplicationError.
        virtual CaptureResult CreateSession(const CaptureConfig& cfg,
            std::unique_ptr<IDuplicationSession>& out, CaptureError& err) = 0;
    };

    // Production backend for this platform, or nullptr when none exists.
    std::unique_ptr<ICaptureBackend> CreateDefaultBackend();

} // namespace roi_capture
