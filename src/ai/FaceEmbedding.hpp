#pragma once
#include <opencv2/core.hpp>
#include "include/types.hpp"

// 검출된 얼굴 영역 -> 128차원 디스크립터
class FaceEmbedding {
	public:
		virtual ~FaceEmbedding() = default;

		// rgb: 8UC3 전체 프레임, box: 그 프레임 좌표계의 얼굴
		virtual bool embed(const cv::Mat& rgb, const FaceBox& box, FaceDescriptor& out) const = 0;
};
