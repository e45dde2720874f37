#include "detect/CascadeLocator.hpp"
#include <QtCore/QDebug>
#include <QString>
#include <filesystem>
#include <opencv2/imgproc.hpp>

namespace fs = std::filesystem;

CascadeLocator::CascadeLocator(const Options& opt) : opt_(opt)
{
		if (!fs::exists(opt_.cascadePath)) {
				qWarning() << "[CascadeLocator] cascade file not found:" << QString::fromStdString(opt_.cascadePath);
				return;
		}

		try {
				ready_ = face_.load(opt_.cascadePath);
		} catch (const cv::Exception& e) {
				qWarning() << "[CascadeLocator] load failed:" << e.what();
				ready_ = false;
		}

		if (!ready_) {
				qWarning() << "[CascadeLocator] cascade not ready";
		}
}

bool CascadeLocator::isReady() const { return ready_; }

cv::Mat CascadeLocator::preprocess(const cv::Mat& rgb) const
{
		cv::Mat gray;
		cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
		cv::equalizeHist(gray, gray);
		return gray;
}

std::vector<FaceBox> CascadeLocator::locate(const cv::Mat& rgb) const
{
		std::vector<FaceBox> out;
		if (!ready_ || rgb.empty()) return out;

		cv::Mat gray = preprocess(rgb);
		std::vector<cv::Rect> faces;
		try {
				std::lock_guard<std::mutex> lk(mtx_);
				face_.detectMultiScale(gray, faces, opt_.scaleFactor, opt_.minNeighbors, 0,
									   cv::Size(opt_.minFaceSize, opt_.minFaceSize));
		} catch (const cv::Exception& e) {
				qWarning() << "[CascadeLocator] detectMultiScale failed:" << e.what();
				return out;
		}

		out.reserve(faces.size());
		for (const auto& r : faces) out.push_back(FaceBox::fromRect(r));
		return out;
}
