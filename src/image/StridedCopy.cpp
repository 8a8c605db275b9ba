#include "StridedCopy.hpp"
#include <cstring>

namespace roi_capture {

    void CopyRows(const std::uint8_t* src, std::size_t srcStride,
        std::uint8_t* dst, std::size_t rowBytes, std::size_t rows)
    {
        if (srcStride == rowBytes) {
            std::memcpy(dst, src, rowBytes * rows);
            return;
        }
        for (std::size_t y = 0; y < rows; ++y) {
            const std::uint8_t* srcRow = src + y * srcStride;
            std::uint8_t* dstRow = dst + y * rowBytes;
            std::memcpy(dstRow, srcRow, rowBytes);
        }
    }

} // namespace roi_capture
