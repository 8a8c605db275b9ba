#pragma once
#include <cstdint>

namespace roi_capture {

	// Scalar curves mapping linear HDR values (1.0 = SDR white) into 0-1
	float ToneMap_ACES(float x);
	float ToneMap_Reinhard(float x);

	float LinearToSRGB(float linear);
	float HalfToFloat(std::uint16_t h);

} // namespace roi_capture
