#pragma once
#include <vector>
#include <opencv2/core.hpp>
#include "include/types.hpp"

// 얼굴 위치 검출 백엔드 공통 인터페이스. 입력은 항상 RGB 8UC3
class FaceLocator {
	public:
		virtual ~FaceLocator() = default;

		// 검출 순서대로 반환. 얼굴이 없으면 빈 벡터
		virtual std::vector<FaceBox> locate(const cv::Mat& rgb) const = 0;
};

// fast 먼저, 실패하면 accurate 로 재시도
class TieredLocator : public FaceLocator {
	public:
		TieredLocator(const FaceLocator* fast, const FaceLocator& accurate)
			: fast_(fast), accurate_(accurate) {}

		std::vector<FaceBox> locate(const cv::Mat& rgb) const override;

	private:
		const FaceLocator* fast_;		// nullptr 이면 accurate 만 사용
		const FaceLocator& accurate_;
};
