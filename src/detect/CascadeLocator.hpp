#pragma once
#include <mutex>
#include <string>
#include <opencv2/objdetect.hpp>
#include "detect/FaceLocator.hpp"
#include "include/recog_params.hpp"

// Haar cascade 기반 "fast" 프로파일
class CascadeLocator : public FaceLocator {
public:
		struct Options {
				std::string cascadePath;
				double scaleFactor = recog::CASCADE_SCALE;
				int minNeighbors   = recog::CASCADE_NEIGHBORS;
				int minFaceSize    = recog::CASCADE_MIN_FACE;		// px
		};

		explicit CascadeLocator(const Options& opt);

		bool isReady() const;

		std::vector<FaceBox> locate(const cv::Mat& rgb) const override;

private:
		Options opt_;
		mutable std::mutex mtx_;
		mutable cv::CascadeClassifier face_;
		bool ready_ = false;

		cv::Mat preprocess(const cv::Mat& rgb) const;
};
