#pragma once
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <opencv2/objdetect.hpp>  // cv::FaceDetectorYN
#include "detect/FaceLocator.hpp"
#include "include/recog_params.hpp"

struct FaceDet {
	cv::Rect box;
	float score = 0.0f;
};

// YuNet 기반 "accurate" 프로파일
class FaceDetector : public FaceLocator {
	public:
		FaceDetector() = default;
		~FaceDetector() override = default;

		// YuNet 초기화 (modelPath 필수)
		bool init(const std::string& modelPath,
				  int inputW = 320, int inputH = 240,
				  float scoreThr = recog::DETECT_THR, float nmsThr = recog::NMS_THR, int topK = recog::TOP_K,
				  int backend = cv::dnn::DNN_BACKEND_OPENCV,
				  int target  = cv::dnn::DNN_TARGET_CPU);

		bool isReady() const { return ready_; }

		// 프레임에서 전체 후보 반환 (원본 좌표계, 점수 내림차순)
		std::vector<FaceDet> detectAll(const cv::Mat& rgb) const;

		std::vector<FaceBox> locate(const cv::Mat& rgb) const override;

	private:
		// YuNet 출력 파서 (score는 맨 끝(14))
		static std::vector<FaceDet> parseYuNet(const cv::Mat& dets, float scoreThresh, const cv::Size& frame);

	private:
		bool ready_ = false;
		int inW_ = 320;
		int inH_ = 240;
		float scoreThr_ = recog::DETECT_THR;
		float nmsThr_ = recog::NMS_THR;
		int topK_ = recog::TOP_K;
		int backend_  = cv::dnn::DNN_BACKEND_OPENCV;
		int target_   = cv::dnn::DNN_TARGET_CPU;

		std::string modelPath_;
		cv::Ptr<cv::FaceDetectorYN> yunet_;		// Yunet 핸들
		mutable std::mutex mtx_;				// YuNet 핸들은 스레드 안전하지 않음
		mutable cv::Size yunet_InputSize_{0, 0};  // setInputSize cache
};
