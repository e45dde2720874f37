#pragma once
#include <array>

namespace recog {
	// 단계적 허용치: 최소 거리가 다음 단계 이하일 때만 완화
	inline constexpr float BASE_TOLERANCE   = 0.60f;
	inline constexpr float RELAX_TOLERANCE1 = 0.65f;
	inline constexpr float RELAX_TOLERANCE2 = 0.70f;
	inline constexpr std::array<float, 3> TOLERANCE_STEPS = { BASE_TOLERANCE, RELAX_TOLERANCE1, RELAX_TOLERANCE2 };

	inline constexpr int    GALLERY_TTL_SEC = 300;

	// YuNet
	inline constexpr float  DETECT_THR = 0.6f;
	inline constexpr float  NMS_THR    = 0.3f;
	inline constexpr int    TOP_K      = 500;

	// Haar cascade
	inline constexpr double CASCADE_SCALE     = 1.1;
	inline constexpr int    CASCADE_NEIGHBORS = 5;
	inline constexpr int    CASCADE_MIN_FACE  = 40;
}
