#pragma once
#include <vector>
#include "include/types.hpp"
#include "include/recog_params.hpp"

struct MatchParams {
	// 오름차순. 첫 값이 기본 허용치, 나머지는 완화 단계
	std::vector<float> tolerances{ recog::TOLERANCE_STEPS.begin(), recog::TOLERANCE_STEPS.end() };
};

// 유클리드 거리 매칭기. 갤러리는 호출 시점에 받아온다(소유권 없음, 수정 안 함)
class FaceMatcher {
	public:
		FaceMatcher() = default;
		explicit FaceMatcher(const MatchParams& p) : p_(p) {}

		MatchResult match(const FaceDescriptor& query, const std::vector<GalleryEntry>& gallery) const;

		static float distance(const FaceDescriptor& a, const FaceDescriptor& b);

		const MatchParams& params() const { return p_; }

	private:
		MatchParams p_;
};
