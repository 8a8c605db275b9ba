#include "FormatNegotiation.hpp"
#include "../util/Logger.hpp"

namespace roi_capture {

    std::vector<PixelFormat> FormatCandidates() {
        return { PixelFormat::BGRA8, PixelFormat::RGBA8, PixelFormat::RGBA_F16 };
    }

    HResult NegotiateFormat(const std::vector<PixelFormat>& candidates,
        const std::function<HResult(PixelFormat)>& tryDuplicate, PixelFormat& chosen)
    {
        chosen = PixelFormat::Unknown;
        HResult last = hr::Unsupported;
        for (PixelFormat fmt : candidates) {
            last = tryDuplicate(fmt);
            if (hr::Succeeded(last)) {
                chosen = fmt;
                return last;
            }
            Logger::Debug(L"Duplication rejected {}, HRESULT: 0x{:x}", ToString(fmt), static_cast<unsigned>(last));
        }
        return last;
    }

} // namespace roi_capture
