#include "PixelConvert.hpp"
#include "ToneMapping.hpp"
#include "../util/Logger.hpp"
#include <algorithm>
#include <cmath>

namespace roi_capture {

    static uint8_t toUnorm8(float v) {
        if (std::isnan(v)) v = 0.0f;
        v = std::clamp(v, 0.0f, 1.0f);
        return static_cast<uint8_t>(v * 255.0f + 0.5f);
    }

    PixelFormat PixelConvert::OutputFormatFor(PixelFormat surfaceFormat) {
        return surfaceFormat == PixelFormat::RGBA_F16 ? PixelFormat::RGBA8 : surfaceFormat;
    }

    bool PixelConvert::ToRGBA8(ImageBuffer& buffer, bool isHDR, float maxLuminance, const CaptureConfig* config) {
        switch (buffer.format) {
        case PixelFormat::BGRA8:
        case PixelFormat::RGBA8:
            return true;
        case PixelFormat::RGBA_F16:
            if (isHDR) {
                processHDR16Float(buffer, maxLuminance, config);
            } else {
                processSDR16Float(buffer);
            }
            return true;
        default:
            Logger::Error(L"Unsupported input format for conversion: {}", ToString(buffer.format));
            return false;
        }
    }

    void PixelConvert::processHDR16Float(ImageBuffer& buffer, float maxLuminance, const CaptureConfig* config) {
        std::vector<uint8_t> rgba(static_cast<size_t>(buffer.width) * buffer.height * 4);

        float targetNits = config ? config->sdrBrightness : 250.0f;
        float maxNits = maxLuminance > 0.0f ? maxLuminance : 1000.0f;
        float exposure = targetNits / maxNits;
        bool aces = config && config->useACESFilmToneMapping;

        for (uint32_t y = 0; y < buffer.height; ++y) {
            const auto* srcRow = reinterpret_cast<const uint16_t*>(buffer.data.data() + static_cast<size_t>(y) * buffer.stride);
            auto* dstRow = rgba.data() + static_cast<size_t>(y) * buffer.width * 4;

            for (uint32_t x = 0; x < buffer.width; ++x) {
                for (int c = 0; c < 3; ++c) {
                    float v = HalfToFloat(srcRow[x * 4 + c]) * exposure;
                    v = aces ? ToneMap_ACES(v) : ToneMap_Reinhard(v);
                    dstRow[x * 4 + c] = toUnorm8(LinearToSRGB(v));
                }
                dstRow[x * 4 + 3] = toUnorm8(HalfToFloat(srcRow[x * 4 + 3]));
            }
        }

        buffer.format = PixelFormat::RGBA8;
        buffer.stride = buffer.width * 4;
        buffer.data = std::move(rgba);
    }

    void PixelConvert::processSDR16Float(ImageBuffer& buffer) {
        std::vector<uint8_t> rgba(static_cast<size_t>(buffer.width) * buffer.height * 4);

        for (uint32_t y = 0; y < buffer.height; ++y) {
            const auto* srcRow = reinterpret_cast<const uint16_t*>(buffer.data.data() + static_cast<size_t>(y) * buffer.stride);
            auto* dstRow = rgba.data() + static_cast<size_t>(y) * buffer.width * 4;

            for (uint32_t x = 0; x < buffer.width; ++x) {
                // scRGB: 1.0 is SDR white, anything above is clipped
                for (int c = 0; c < 3; ++c) {
                    float v = std::clamp(HalfToFloat(srcRow[x * 4 + c]), 0.0f, 1.0f);
                    dstRow[x * 4 + c] = toUnorm8(LinearToSRGB(v));
                }
                dstRow[x * 4 + 3] = toUnorm8(HalfToFloat(srcRow[x * 4 + 3]));
            }
        }

        buffer.format = PixelFormat::RGBA8;
        buffer.stride = buffer.width * 4;
        buffer.data = std::move(rgba);
    }

} // namespace roi_capture
