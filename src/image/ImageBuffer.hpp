#pragma once
#include <cstdint>
#include <vector>

namespace roi_capture {

    enum class PixelFormat {
        Unknown,
        BGRA8,       // B8G8R8A8_UNORM
        RGBA8,       // R8G8B8A8_UNORM
        RGBA_F16     // R16G16B16A16_FLOAT
    };

    inline constexpr std::uint32_t BytesPerPixel(PixelFormat f) {
        switch (f) {
        case PixelFormat::BGRA8:
        case PixelFormat::RGBA8:
            return 4;
        case PixelFormat::RGBA_F16:
            return 8;
        default:
            return 0;
        }
    }

    inline const wchar_t* ToString(PixelFormat f) {
        switch (f) {
        case PixelFormat::BGRA8:    return L"B8G8R8A8_UNORM";
        case PixelFormat::RGBA8:    return L"R8G8B8A8_UNORM";
        case PixelFormat::RGBA_F16: return L"R16G16B16A16_FLOAT";
        default:                    return L"UNKNOWN";
        }
    }

    struct ImageBuffer {
        PixelFormat format = PixelFormat::Unknown;
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        std::uint32_t stride = 0;         // bytes per row, no padding
        std::vector<std::uint8_t> data;   // raw pixels
    };

} // namespace roi_capture
