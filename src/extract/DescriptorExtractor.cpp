#include "extract/DescriptorExtractor.hpp"
#include "codec/ImagePayload.hpp"
#include <QtCore/QDebug>
#include <opencv2/imgproc.hpp>

cv::Mat DescriptorExtractor::toRgb(const cv::Mat& image)
{
	if (image.empty()) return cv::Mat();

	cv::Mat src = image;
	if (src.depth() == CV_16U) {
		src.convertTo(src, CV_8U, 1.0 / 256.0);
	} else if (src.depth() != CV_8U) {
		double minV = 0.0, maxV = 0.0;
		cv::minMaxLoc(src.reshape(1), &minV, &maxV);
		const double scale = (maxV > minV) ? 255.0 / (maxV - minV) : 1.0;
		src.convertTo(src, CV_8U, scale, -minV * scale);
	}

	cv::Mat rgb;
	switch (src.channels()) {
		case 1: cv::cvtColor(src, rgb, cv::COLOR_GRAY2RGB); break;
		case 3: cv::cvtColor(src, rgb, cv::COLOR_BGR2RGB);  break;
		case 4: cv::cvtColor(src, rgb, cv::COLOR_BGRA2RGB); break;
		default:
			qWarning() << "[DescriptorExtractor] unsupported channel count" << src.channels();
			return cv::Mat();
	}
	return rgb;
}

ExtractResult DescriptorExtractor::extract(const cv::Mat& image) const
{
	ExtractResult r;

	cv::Mat rgb = toRgb(image);
	if (rgb.empty()) {
		r.status = ExtractResult::Status::Failed;
		r.error  = QStringLiteral("Unsupported image format");
		return r;
	}

	const auto boxes = locator_.locate(rgb);
	if (boxes.empty()) {
		qDebug() << "[DescriptorExtractor] no face detected";
		r.status = ExtractResult::Status::NoFace;
		return r;
	}

	// 여러 얼굴이면 첫 번째만 사용
	FaceDescriptor d{};
	if (!embedding_.embed(rgb, boxes.front(), d)) {
		qWarning() << "[DescriptorExtractor] embedding failed for detected face";
		r.status = ExtractResult::Status::Failed;
		r.error  = QStringLiteral("Face embedding failed");
		return r;
	}

	r.status     = ExtractResult::Status::Ok;
	r.descriptor = d;
	r.box        = boxes.front();
	return r;
}

ExtractResult DescriptorExtractor::extractFromPayload(const QString& payload) const
{
	return extract(ImagePayload::decodeBase64(payload));
}
