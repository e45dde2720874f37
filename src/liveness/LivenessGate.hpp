#pragma once
#include <vector>
#include <QString>
#include <QStringList>
#include <opencv2/core.hpp>
#include "detect/FaceLocator.hpp"
#include "include/types.hpp"

// 라이브니스 임계값 (경험적으로 튜닝한 값, 실제 영상으로 재검증 필요)
// 픽셀 단위는 0~255, 박스 단위는 픽셀
struct LivenessParams {
	int    minFrames             = 5;
	double minFrameDiff          = 2.0;		// 연속 프레임 평균 절대차 최소값
	double minDiffVariance       = 1.0;
	double minDiffMean           = 1.0;
	double minBrightnessVariance = 1.0;
	double minColorVarianceRange = 2.0;
	double minEdgeVariance       = 1.0;
	int    minFaceFrames         = 3;		// 얼굴이 보여야 하는 최소 프레임 수
	double minBoxStd             = 0.2;		// 박스 6개 지표 표준편차 최대값의 하한
	double confidenceScale       = 2.0;		// confidence = min(1, maxStd / scale)
	double minStdSpread          = 0.05;		// max(std) - min(std)
	double minMovementVariance   = 0.1;
	double minMovementMean       = 0.5;
	double minAreaVariance       = 1.0;
	double minAreaRange          = 0.5;
	double minAccelVariance      = 0.1;
};

// 연속 프레임 기반 휴리스틱 라이브니스 검사 (사진/화면 재생 차단)
// 상태 없음: 여러 요청 스레드에서 동시에 호출 가능
class LivenessGate {
	public:
		explicit LivenessGate(const FaceLocator& locator, const LivenessParams& p = {})
			: locator_(locator), p_(p) {}

		// 하나라도 실패하면 (false, 0, 이유) 즉시 반환
		LivenessResult check(const std::vector<cv::Mat>& frames) const;

		// base64 프레임들. 디코딩 실패 시 ImageDecodeError
		LivenessResult checkPayloads(const QStringList& payloads) const;

		const LivenessParams& params() const { return p_; }

	private:
		LivenessResult checkPixels(const std::vector<cv::Mat>& rgb) const;
		LivenessResult checkMovement(const std::vector<FaceBox>& boxes, int frameCount) const;

		static LivenessResult fail(const QString& reason);

	private:
		const FaceLocator& locator_;
		LivenessParams p_;
};
