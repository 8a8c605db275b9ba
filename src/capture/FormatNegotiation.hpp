#pragma once
#include "CaptureCommon.hpp"
#include "../image/ImageBuffer.hpp"
#include <functional>
#include <vector>

namespace roi_capture {

    // Duplication formats in preference order: BGRA8, RGBA8, RGBA_F16.
    std::vector<PixelFormat> FormatCandidates();

    // Tries each candidate in order and stops at the first one `tryDuplicate` accepts.
    // Returns the last failure code when none is accepted (hr::Unsupported for an empty list).
    HResult NegotiateFormat(const std::vector<PixelFormat>& candidates,
        const std::function<HResult(PixelFormat)>& tryDuplicate, PixelFormat& chosen);

} // namespace roi_capture
