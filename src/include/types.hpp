#pragma once
#include <array>
#include <cstddef>
#include <vector>
#include <QByteArray>
#include <QString>
#include <opencv2/core.hpp>

// dlib/SFace 계열 얼굴 디스크립터 차원
inline constexpr std::size_t kDescriptorDim = 128;

// 항상 128개 float32. 생성 후에는 변경하지 않는다
using FaceDescriptor = std::array<float, kDescriptorDim>;

// 얼굴 박스 (top, right, bottom, left 픽셀 좌표)
struct FaceBox {
	int top    = 0;
	int right  = 0;
	int bottom = 0;
	int left   = 0;

	int width()  const { return right - left; }
	int height() const { return bottom - top; }

	cv::Rect toRect() const { return cv::Rect(left, top, width(), height()); }

	static FaceBox fromRect(const cv::Rect& r) {
		return FaceBox{ r.y, r.x + r.width, r.y + r.height, r.x };
	}
};

inline bool operator==(const FaceBox& a, const FaceBox& b) {
	return a.top == b.top && a.right == b.right && a.bottom == b.bottom && a.left == b.left;
}

// 갤러리 항목: 직원당 디스크립터 1개
struct GalleryEntry {
	int            employeeId = -1;
	FaceDescriptor descriptor{};
};

// DB에서 읽은 원본 행 (디코딩 전)
struct StoredDescriptor {
	int        employeeId = -1;
	QByteArray blob;
	int        encodingTag = 0;		// DescriptorEncoding
};

enum class MatchStatus {
	Matched = 0,
	NoMatch,
	EmptyGallery
};

// 매칭 결과
struct MatchResult {
	MatchStatus status      = MatchStatus::EmptyGallery;
	int         employeeId  = -1;
	float       distance    = -1.0f;		// 매칭된 항목의 거리
	float       minDistance = -1.0f;		// 갤러리 전체의 최소 거리
	float       tolerance   = 0.0f;		// 최종 적용된 허용치
	float       similarity  = 0.0f;		// (1 - minDistance) * 100

	bool matched() const { return status == MatchStatus::Matched; }
};

// 라이브니스 판정 결과
struct LivenessResult {
	bool    isLive     = false;
	float   confidence = 0.0f;		// [0, 1]
	QString reason;
};
