#include "RegionCapture.hpp"
#include "../image/PixelConvert.hpp"
#include "../image/StridedCopy.hpp"
#include "../util/Logger.hpp"
#include "../util/ScopedCapture.hpp"

namespace roi_capture {

    // Frames are polled, never waited for
    static constexpr std::uint32_t kPollTimeoutMs = 0;

    RegionCapture::RegionCapture(std::unique_ptr<ICaptureBackend> backend, CaptureConfig cfg)
        : backend_(std::move(backend)), cfg_(std::move(cfg))
    {
        if (cfg_.debugMode) {
            Logger::EnableDebug(true);
            Logger::EnableFileLogging(cfg_.logFile);
        }
    }

    RegionCapture::~RegionCapture() {
        Shutdown();
    }

    CaptureResult RegionCapture::Initialize() {
        Shutdown();

        if (!backend_) {
            return fail(CaptureResult::DeviceInitError, hr::NotFound, L"no capture backend on this platform");
        }

        std::unique_ptr<IDuplicationSession> fresh;
        CaptureError err;
        CaptureResult r = backend_->CreateSession(cfg_, fresh, err);
        if (r != CaptureResult::Success || !fresh) {
            if (r == CaptureResult::Success) r = CaptureResult::DeviceInitError;
            return fail(r, err.nativeCode, err.message.empty() ? std::wstring(L"CreateSession failed") : err.message);
        }

        // Swap in the whole bundle at once; the staging surface was dropped by Shutdown()
        session_ = std::move(fresh);
        output_ = session_->Output();
        format_ = session_->Format();
        lastError_ = {};

        Logger::Info(L"Capture session ready: {}x{}, format {}, HDR {}",
            output_.width, output_.height, ToString(format_), output_.hdrEnabled ? L"Yes" : L"No");
        return CaptureResult::Success;
    }

    void RegionCapture::Shutdown() {
        // surfaces before the device that created them
        staging_.Reset();
        session_.reset();
    }

    PixelFormat RegionCapture::OutputPixelFormat() const {
        return PixelConvert::OutputFormatFor(format_);
    }

    CaptureResult RegionCapture::CaptureRegion(std::uint32_t left, std::uint32_t top,
        std::uint32_t width, std::uint32_t height, ImageBuffer& out)
    {
        out = {};

        // Bounds come from the live session; a rebuilt one may drive a different mode
        if (!session_) {
            CaptureResult r = Initialize();
            if (r != CaptureResult::Success) return r;
        }

        const std::uint64_t right = static_cast<std::uint64_t>(left) + width;
        const std::uint64_t bottom = static_cast<std::uint64_t>(top) + height;
        if (right > output_.width || bottom > output_.height) {
            return fail(CaptureResult::ValidationError, hr::InvalidArg,
                fmt::format(L"region ({},{} {}x{}) exceeds output {}x{}", left, top, width, height, output_.width, output_.height));
        }

        CaptureError err;
        if (staging_.Ensure(session_.get(), width, height, err) != CaptureResult::Success) {
            lastError_ = std::move(err);
            return lastError_.result;
        }

        const Region region{ left, top, width, height };
        bool gotFrame = false;
        CaptureResult r = acquireAndCopy(region, gotFrame);
        if (r != CaptureResult::Success) return r;

        if (!gotFrame) {
            out.format = OutputPixelFormat();
            out.width = width;
            out.height = height;
            out.stride = width * 4;
            out.data.assign(static_cast<size_t>(width) * height * 4, 0);
            Logger::Debug(L"No new frame, returning {} zero bytes", out.data.size());
            return CaptureResult::Success;
        }

        return readback(region, out);
    }

    CaptureResult RegionCapture::acquireAndCopy(const Region& region, bool& gotFrame) {
        gotFrame = false;

        bool hasFrame = false;
        HResult h = session_->AcquireNextFrame(kPollTimeoutMs, hasFrame);
        if (h == hr::WaitTimeout) {
            return CaptureResult::Success;
        }
        if (hr::Failed(h)) {
            if (IsTransientDeviceLoss(h)) {
                return recoverFromDeviceLoss(region, h);
            }
            return fail(CaptureResult::FatalCaptureError, h, L"AcquireNextFrame failed");
        }

        ScopedFrame frame(*session_);
        if (!hasFrame) {
            return CaptureResult::Success;
        }

        HResult c = session_->CopyFrameRegion(*staging_.Surface(), region);
        if (hr::Failed(c)) {
            return fail(CaptureResult::FatalCaptureError, c, L"CopyFrameRegion failed");
        }

        gotFrame = true;
        return CaptureResult::Success;
    }

    // Rebuilds the session once; the current call still reports the loss.
    CaptureResult RegionCapture::recoverFromDeviceLoss(const Region& region, HResult cause) {
        Logger::Warn(L"Device lost (HRESULT: 0x{:x}), reinitializing capture session", static_cast<unsigned>(cause));

        if (Initialize() != CaptureResult::Success) {
            return fail(CaptureResult::DeviceInitError, lastError_.nativeCode,
                L"reinitialization after device loss failed: " + lastError_.message);
        }

        CaptureError err;
        if (staging_.Ensure(session_.get(), region.width, region.height, err) != CaptureResult::Success) {
            lastError_ = std::move(err);
            return lastError_.result;
        }

        return fail(CaptureResult::TransientCaptureError, cause, L"device lost during frame acquisition, session rebuilt");
    }

    CaptureResult RegionCapture::readback(const Region& region, ImageBuffer& out) {
        const std::uint32_t bpp = BytesPerPixel(format_);
        const size_t rowBytes = static_cast<size_t>(region.width) * bpp;

        ImageBuffer raw;
        raw.format = format_;
        raw.width = region.width;
        raw.height = region.height;
        raw.stride = static_cast<std::uint32_t>(rowBytes);
        raw.data.resize(rowBytes * region.height);

        {
            IStagingSurface& surface = *staging_.Surface();
            MappedSurface mapped{};
            HResult h = session_->Map(surface, mapped);
            if (hr::Failed(h)) {
                return fail(CaptureResult::MappingError, h, L"Map of staging surface failed");
            }
            ScopedMap unmap(*session_, surface);

            if (!mapped.data || mapped.rowPitch < rowBytes) {
                return fail(CaptureResult::MappingError, hr::Fail,
                    fmt::format(L"mapped row pitch {} below row size {}", mapped.rowPitch, rowBytes));
            }
            CopyRows(mapped.data, mapped.rowPitch, raw.data.data(), rowBytes, region.height);
        }

        if (!PixelConvert::ToRGBA8(raw, output_.hdrEnabled, output_.hdr.maxLuminance, &cfg_)) {
            return fail(CaptureResult::FatalCaptureError, hr::Unsupported, L"unsupported surface format");
        }

        out = std::move(raw);
        lastError_ = {};
        return CaptureResult::Success;
    }

    CaptureResult RegionCapture::fail(CaptureResult r, HResult code, std::wstring message) {
        lastError_ = { r, code, std::move(message) };
        if (r == CaptureResult::ValidationError || r == CaptureResult::TransientCaptureError) {
            Logger::Warn(L"{}: {}", ToString(r), lastError_.message);
        } else {
            Logger::Error(L"{}: {} (HRESULT: 0x{:x})", ToString(r), lastError_.message, static_cast<unsigned>(code));
        }
        return r;
    }

} // namespace roi_capture
