#pragma once
#include "../capture/CaptureBackend.hpp"
#include "Logger.hpp"

namespace roi_capture {

    // Releases an acquired duplication frame on every exit path.
    struct ScopedFrame {
        IDuplicationSession* session = nullptr;
        explicit ScopedFrame(IDuplicationSession& s) :session(&s) {}
        ~ScopedFrame() {
            if (!session) return;
            HResult h = session->ReleaseFrame();
            if (hr::Failed(h)) Logger::Warn(L"ReleaseFrame failed, HRESULT: 0x{:x}", static_cast<unsigned>(h));
        }
        ScopedFrame(const ScopedFrame&) = delete;
        ScopedFrame& operator=(const ScopedFrame&) = delete;
    };

    // Unmaps a mapped staging surface on every exit path.
    struct ScopedMap {
        IDuplicationSession* session = nullptr; IStagingSurface* surface = nullptr;
        ScopedMap(IDuplicationSession& s, IStagingSurface& surf) :session(&s), surface(&surf) {}
        ~ScopedMap() { if (session && surface) session->Unmap(*surface); }
        ScopedMap(const ScopedMap&) = delete;
        ScopedMap& operator=(const ScopedMap&) = delete;
    };

} // namespace roi_capture
