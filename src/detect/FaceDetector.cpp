#include "detect/FaceDetector.hpp"
#include <QtCore/QDebug>
#include <QString>
#include <algorithm>
#include <opencv2/imgproc.hpp>


bool FaceDetector::init(const std::string& modelPath,
						int inputW, int inputH,
						float scoreThr, float nmsThr, int topK,
						int backend, int target)
{
	modelPath_ = modelPath;
	inW_ = inputW; inH_ = inputH;
	scoreThr_ = scoreThr; nmsThr_ = nmsThr;
	topK_ = topK; backend_ = backend; target_ = target;

	try {
		yunet_ = cv::FaceDetectorYN::create(
				modelPath_, /*config=*/"", cv::Size(inW_, inH_),
				scoreThr_, nmsThr_, topK_, backend_, target_);
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] YuNet create failed:" << e.what();
		ready_ = false;
		return false;
	}

	ready_ = (yunet_ != nullptr);
	yunet_InputSize_ = cv::Size(0,0);			// 첫 프레임에서 갱신
	if (!ready_) {
		qWarning() << "[FaceDetector] YuNet not ready";
		return false;
	}

	qDebug() << "[FaceDetector] YuNet init Ok"
			 << "model=" << QString::fromStdString(modelPath_)
			 << "in="    << inW_      << "x" << inH_
			 << "thr="   << scoreThr_ << "/" << nmsThr_
			 << "topK="  << topK_     << " backend=" << backend_
			 << "target=" << target_;

	return true;
}

std::vector<FaceDet> FaceDetector::parseYuNet(const cv::Mat& dets, float scoreThresh, const cv::Size& frame)
{
	std::vector<FaceDet> out;
	if (dets.empty() || dets.cols < 15) return out;

	const cv::Rect full(0, 0, frame.width, frame.height);
	for (int i = 0; i < dets.rows; ++i) {
		const float x = dets.at<float>(i, 0);
		const float y = dets.at<float>(i, 1);
		const float w = dets.at<float>(i, 2);
		const float h = dets.at<float>(i, 3);

		const float score = dets.at<float>(i, 14);
		if (score < scoreThresh) continue;

		// 프레임 밖으로 나간 박스는 잘라서 사용
		const cv::Rect box = cv::Rect(cv::Point2f(x, y), cv::Size2f(w, h)) & full;
		if (box.width <= 0 || box.height <= 0) continue;

		out.push_back(FaceDet{ box, score });
	}

	std::stable_sort(out.begin(), out.end(),
			[](const FaceDet& a, const FaceDet& b) { return a.score > b.score; });
	return out;
}

std::vector<FaceDet> FaceDetector::detectAll(const cv::Mat& rgb) const
{
	std::vector<FaceDet> out;
	if (!ready_) return out;
	if (rgb.empty()) return out;

	cv::Mat bgr;
	cv::cvtColor(rgb, bgr, cv::COLOR_RGB2BGR);		// YuNet 은 BGR 입력

	std::lock_guard<std::mutex> lk(mtx_);

	// YuNet 입력 크기 갱신 (프레임 크기 변경 시 필수)
	try {
		const cv::Size cur = bgr.size();
		if (cur != yunet_InputSize_) {
			yunet_->setInputSize(cur);
			yunet_InputSize_ = cur;
		}
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] setInputSize failed:" << e.what();
		return out;
	}

	cv::Mat dets;
	try {
		yunet_->detect(bgr, dets);
	} catch (const cv::Exception& e) {
		qWarning() << "[FaceDetector] detect failed:" << e.what();
		return out;
	}

	out = parseYuNet(dets, scoreThr_, bgr.size());
	qDebug() << "[FaceDetector] parsed faces=" << (int)out.size();
	return out;
}

std::vector<FaceBox> FaceDetector::locate(const cv::Mat& rgb) const
{
	std::vector<FaceBox> boxes;
	for (const auto& d : detectAll(rgb)) boxes.push_back(FaceBox::fromRect(d.box));
	return boxes;
}
