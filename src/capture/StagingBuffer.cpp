#include "StagingBuffer.hpp"
#include "../util/Logger.hpp"

namespace roi_capture {

    CaptureResult StagingBuffer::Ensure(IDuplicationSession* session, std::uint32_t width, std::uint32_t height, CaptureError& err) {
        if (Matches(width, height)) return CaptureResult::Success;

        Reset();

        if (!session) {
            err = { CaptureResult::AllocationError, hr::InvalidCall, L"staging surface requested without a session" };
            Logger::Error(L"StagingBuffer: {}", err.message);
            return err.result;
        }
        if (width == 0 || height == 0) {
            err = { CaptureResult::AllocationError, hr::InvalidArg, L"staging surface size must be non-zero" };
            Logger::Error(L"StagingBuffer: {} ({}x{})", err.message, width, height);
            return err.result;
        }

        std::unique_ptr<IStagingSurface> fresh;
        HResult h = session->CreateStagingSurface(width, height, fresh);
        if (hr::Failed(h) || !fresh || !fresh->IsValid()) {
            err = { CaptureResult::AllocationError, hr::Failed(h) ? h : hr::Fail, L"CreateStagingSurface failed" };
            Logger::Error(L"StagingBuffer: {} for {}x{}, HRESULT: 0x{:x}", err.message, width, height, static_cast<unsigned>(err.nativeCode));
            return err.result;
        }

        surface_ = std::move(fresh);
        width_ = width;
        height_ = height;
        ++allocations_;
        Logger::Debug(L"StagingBuffer: allocated {}x{} (#{})", width, height, allocations_);
        return CaptureResult::Success;
    }

    void StagingBuffer::Reset() {
        surface_.reset();
        width_ = 0;
        height_ = 0;
    }

} // namespace roi_capture
