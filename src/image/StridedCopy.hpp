#pragma once
#include <cstddef>
#include <cstdint>

namespace roi_capture {

    // Copies `rows` rows of `rowBytes` each from a source whose rows start `srcStride` bytes apart
    // into a tightly packed destination (`rows * rowBytes` bytes). srcStride must be >= rowBytes.
    void CopyRows(const std::uint8_t* src, std::size_t srcStride,
        std::uint8_t* dst, std::size_t rowBytes, std::size_t rows);

} // namespace roi_capture
