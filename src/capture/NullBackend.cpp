#include "CaptureBackend.hpp"
#include "../util/Logger.hpp"

namespace roi_capture {

    // Desktop duplication is a DXGI facility; other platforms link this instead of DXGIBackend.cpp.
    std::unique_ptr<ICaptureBackend> CreateDefaultBackend() {
        Logger::Warn(L"No desktop duplication backend on this platform");
        return nullptr;
    }

} // namespace roi_capture
