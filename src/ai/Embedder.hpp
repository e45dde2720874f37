#pragma once
#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>
#include <QString>
#include <mutex>
#include "ai/FaceEmbedding.hpp"

// SFace(ONNX) 128차원 임베딩
class Embedder : public FaceEmbedding {
public:
		struct Options {
				QString modelPath;
				int inputSize = 112;		// 112x112 입력
				float boxScale = 1.15f;		// 크롭 전에 박스 확장 비율
				bool flipTTA = true;		// 좌우반전 평균
				enum class Norm { Raw, MinusOneToOne } norm = Norm::Raw;
		};

		explicit Embedder(const Options& opt);
		bool isReady() const;

		bool embed(const cv::Mat& rgb, const FaceBox& box, FaceDescriptor& out) const override;

		// 정렬/크롭된 얼굴 이미지에서 추출
		bool extract(const cv::Mat& face_rgb, FaceDescriptor& out) const;

		static cv::Rect expandRect(const cv::Rect& r, float scale, const cv::Size& imgSz);

private:
		Options opt_;
		mutable std::mutex mtx_;
		mutable cv::dnn::Net net_;
		bool ready_ = false;

		cv::Mat preprocess(const cv::Mat& src) const;
		cv::Mat forward(const cv::Mat& face_rgb) const;
		static void l2normalize(cv::Mat& row);
};
