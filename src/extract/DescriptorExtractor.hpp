#pragma once
#include <optional>
#include <QString>
#include <opencv2/core.hpp>
#include "ai/FaceEmbedding.hpp"
#include "detect/FaceLocator.hpp"
#include "include/types.hpp"

struct ExtractResult {
	enum class Status {
		Ok = 0,
		NoFace,		// 정상 결과: 얼굴 없음
		Failed		// 임베딩 실패
	};

	Status status = Status::NoFace;
	std::optional<FaceDescriptor> descriptor;
	FaceBox box;
	QString error;

	bool ok() const { return status == Status::Ok; }
};

// 이미지 -> 디스크립터 0개 또는 1개. 상태 없음 (동시 호출 가능)
class DescriptorExtractor {
	public:
		DescriptorExtractor(const FaceLocator& locator, const FaceEmbedding& embedding)
			: locator_(locator), embedding_(embedding) {}

		ExtractResult extract(const cv::Mat& image) const;

		// base64 payload 디코딩 실패 시 ImageDecodeError
		ExtractResult extractFromPayload(const QString& payload) const;

		// gray / BGR / BGRA / 16bit -> RGB 8UC3
		static cv::Mat toRgb(const cv::Mat& image);

	private:
		const FaceLocator&   locator_;
		const FaceEmbedding& embedding_;
};
