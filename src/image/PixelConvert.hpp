#pragma once
#include "ImageBuffer.hpp"
#include "../config/Config.hpp"

namespace roi_capture {

	class PixelConvert {
	public:
		// Normalizes a packed buffer to 4 bytes per pixel. 8-bit formats pass through unchanged;
		// RGBA_F16 becomes RGBA8 (HDR frames are exposure-scaled and tone mapped first).
		static bool ToRGBA8(ImageBuffer& buffer, bool isHDR = false, float maxLuminance = 1000.0f,
			const CaptureConfig* config = nullptr);

		// Pixel format of the bytes ToRGBA8 produces for a given surface format
		static PixelFormat OutputFormatFor(PixelFormat surfaceFormat);

	private:
		static void processHDR16Float(ImageBuffer& buffer, float maxLuminance, const CaptureConfig* config);
		static void processSDR16Float(ImageBuffer& buffer);
	};

} // namespace roi_capture
