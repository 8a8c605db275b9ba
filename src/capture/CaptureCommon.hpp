#pragma once
#include <cstdint>
#include <string>

namespace roi_capture {

    // HRESULT-compatible native status. Values match the DXGI SDK (checked in DXGIBackend.cpp).
    using HResult = std::int32_t;

    namespace hr {
        inline constexpr HResult Ok                  = 0;
        inline constexpr HResult Fail                = static_cast<HResult>(0x80004005u); // E_FAIL
        inline constexpr HResult InvalidArg          = static_cast<HResult>(0x80070057u); // E_INVALIDARG
        inline constexpr HResult OutOfMemory         = static_cast<HResult>(0x8007000Eu); // E_OUTOFMEMORY
        inline constexpr HResult NoInterface         = static_cast<HResult>(0x80004002u); // E_NOINTERFACE
        inline constexpr HResult InvalidCall         = static_cast<HResult>(0x887A0001u);
        inline constexpr HResult NotFound            = static_cast<HResult>(0x887A0002u);
        inline constexpr HResult Unsupported         = static_cast<HResult>(0x887A0004u);
        inline constexpr HResult DeviceRemoved       = static_cast<HResult>(0x887A0005u);
        inline constexpr HResult DeviceReset         = static_cast<HResult>(0x887A0007u);
        inline constexpr HResult AccessLost          = static_cast<HResult>(0x887A0026u);
        inline constexpr HResult WaitTimeout         = static_cast<HResult>(0x887A0027u);
        inline constexpr HResult SessionDisconnected = static_cast<HResult>(0x887A0028u);

        inline constexpr bool Succeeded(HResult h) { return h >= 0; }
        inline constexpr bool Failed(HResult h) { return h < 0; }
    } // namespace hr

    // Device-loss conditions that are recovered by rebuilding the whole session.
    inline constexpr bool IsTransientDeviceLoss(HResult h) {
        return h == hr::AccessLost ||
               h == hr::DeviceRemoved ||
               h == hr::DeviceReset ||
               h == hr::SessionDisconnected;
    }

    struct HDRMetadata {
        float maxLuminance = 1000.0f;
        float minLuminance = 0.1f;
        float maxContentLightLevel = 1000.0f;
    };

    // Full surface of the duplicated output, fixed until the next (re)initialization.
    struct OutputDesc {
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        bool hdrEnabled = false;
        HDRMetadata hdr{};
    };

    struct Region {
        std::uint32_t left = 0;
        std::uint32_t top = 0;
        std::uint32_t width = 0;
        std::uint32_t height = 0;
    };

    enum class CaptureResult {
        Success,
        ValidationError,       // region outside the output, caller's fault
        DeviceInitError,       // no device / output could be created
        DuplicationError,      // no candidate format accepted by the output
        AllocationError,       // staging surface rejected
        TransientCaptureError, // device lost, session already rebuilt for the next call
        FatalCaptureError,     // unrecognized acquisition or copy failure
        MappingError           // staging surface could not be mapped for read
    };

    struct CaptureError {
        CaptureResult result = CaptureResult::Success;
        HResult nativeCode = hr::Ok;
        std::wstring message;
    };

    inline const wchar_t* ToString(CaptureResult r) {
        switch (r) {
        case CaptureResult::Success:               return L"Success";
        case CaptureResult::ValidationError:       return L"ValidationError";
        case CaptureResult::DeviceInitError:       return L"DeviceInitError";
        case CaptureResult::DuplicationError:      return L"DuplicationError";
        case CaptureResult::AllocationError:       return L"AllocationError";
        case CaptureResult::TransientCaptureError: return L"TransientCaptureError";
        case CaptureResult::FatalCaptureError:     return L"FatalCaptureError";
        case CaptureResult::MappingError:          return L"MappingError";
        }
        return L"Unknown";
    }

} // namespace roi_capture
