#include "LivenessGate.hpp"
#include "codec/ImagePayload.hpp"
#include "extract/DescriptorExtractor.hpp"
#include "log/SystemLogger.hpp"
#include <QtCore/QDebug>
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

namespace {

double meanOf(const std::vector<double>& v)
{
	if (v.empty()) return 0.0;
	double s = 0.0;
	for (double x : v) s += x;
	return s / static_cast<double>(v.size());
}

// 모분산
double varianceOf(const std::vector<double>& v)
{
	if (v.empty()) return 0.0;
	const double m = meanOf(v);
	double s = 0.0;
	for (double x : v) s += (x - m) * (x - m);
	return s / static_cast<double>(v.size());
}

double stdOf(const std::vector<double>& v) { return std::sqrt(varianceOf(v)); }

double rangeOf(const std::vector<double>& v)
{
	if (v.empty()) return 0.0;
	auto mm = std::minmax_element(v.begin(), v.end());
	return *mm.second - *mm.first;
}

bool samePixels(const cv::Mat& a, const cv::Mat& b)
{
	if (a.size() != b.size() || a.type() != b.type()) return false;
	return cv::norm(a, b, cv::NORM_INF) == 0.0;
}

// 모든 채널 평균 절대차
double meanAbsDiff(const cv::Mat& a, const cv::Mat& b)
{
	cv::Mat d;
	cv::absdiff(a, b, d);
	const cv::Scalar m = cv::mean(d);
	return (m[0] + m[1] + m[2]) / 3.0;
}

double brightnessOf(const cv::Mat& rgb)
{
	cv::Mat gray;
	cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
	return cv::mean(gray)[0];
}

double colorVarianceOf(const cv::Mat& rgb)
{
	cv::Scalar mu, sigma;
	cv::meanStdDev(rgb.reshape(1), mu, sigma);
	return sigma[0] * sigma[0];
}

// Sobel 그래디언트 크기의 평균
double edgeStrengthOf(const cv::Mat& rgb)
{
	cv::Mat gray, gx, gy, mag;
	cv::cvtColor(rgb, gray, cv::COLOR_RGB2GRAY);
	cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
	cv::Sobel(gray, gy, CV_64F, 0, 1, 3);
	cv::magnitude(gx, gy, mag);
	return cv::mean(mag)[0];
}

QString num(double v) { return QString::number(v, 'f', 2); }

} // namespace

LivenessResult LivenessGate::fail(const QString& reason)
{
	qInfo() << "[LivenessGate] FAIL:" << reason;
	SystemLogger::info("LIVENESS", QStringLiteral("Liveness rejected"), reason);

	LivenessResult r;
	r.isLive     = false;
	r.confidence = 0.0f;
	r.reason     = reason;
	return r;
}

LivenessResult LivenessGate::checkPayloads(const QStringList& payloads) const
{
	std::vector<cv::Mat> frames;
	frames.reserve(static_cast<size_t>(payloads.size()));
	for (const auto& p : payloads) frames.push_back(ImagePayload::decodeBase64(p));
	return check(frames);
}

LivenessResult LivenessGate::check(const std::vector<cv::Mat>& frames) const
{
	const int n = static_cast<int>(frames.size());
	if (n < p_.minFrames) {
		return fail(QString("Insufficient frames for liveness check: at least %1 frames required, got %2")
						.arg(p_.minFrames).arg(n));
	}

	// RGB 8UC3, 첫 프레임 크기로 통일
	std::vector<cv::Mat> rgb;
	rgb.reserve(frames.size());
	for (const auto& f : frames) {
		cv::Mat c = DescriptorExtractor::toRgb(f);
		if (c.empty()) return fail(QStringLiteral("Unsupported frame format"));
		rgb.push_back(std::move(c));
	}

	// === 1) 완전히 같은 프레임 ===
	for (int i = 0; i < n; ++i) {
		for (int j = i + 1; j < n; ++j) {
			if (samePixels(rgb[i], rgb[j])) {
				return fail(QString("Identical frames detected (frames %1 and %2) - static photo or replay suspected")
								.arg(i).arg(j));
			}
		}
	}

	const cv::Size ref = rgb.front().size();
	for (auto& m : rgb) {
		if (m.size() != ref) cv::resize(m, m, ref);
	}

	if (auto r = checkPixels(rgb); !r.reason.isEmpty()) return r;

	// === 6) 얼굴 검출 ===
	std::vector<FaceBox> boxes;
	for (const auto& m : rgb) {
		const auto found = locator_.locate(m);
		if (!found.empty()) boxes.push_back(found.front());
	}
	const int detected = static_cast<int>(boxes.size());
	qDebug() << "[LivenessGate] faces detected in" << detected << "of" << n << "frames";
	if (detected < p_.minFaceFrames) {
		return fail(QString("Face detected in only %1 of %2 frames (need at least %3) - keep your face in view")
						.arg(detected).arg(n).arg(p_.minFaceFrames));
	}

	LivenessResult r = checkMovement(boxes, n);
	if (r.isLive) {
		qInfo() << "[LivenessGate] PASS confidence=" << r.confidence;
		SystemLogger::info("LIVENESS", r.reason, QString("confidence=%1").arg(r.confidence));
	}
	return r;
}

// 통과하면 reason 이 빈 결과
LivenessResult LivenessGate::checkPixels(const std::vector<cv::Mat>& rgb) const
{
	const size_t n = rgb.size();

	// === 2) 연속 프레임 차이 ===
	std::vector<double> diffs;
	for (size_t i = 1; i < n; ++i) diffs.push_back(meanAbsDiff(rgb[i - 1], rgb[i]));
	if (diffs.empty()) return LivenessResult{};
	const double minDiff = *std::min_element(diffs.begin(), diffs.end());
	qDebug() << "[LivenessGate] frame diffs min=" << minDiff << "mean=" << meanOf(diffs);
	if (minDiff < p_.minFrameDiff) {
		return fail(QString("Frames too similar (minimum difference %1 < %2) - please move naturally")
						.arg(num(minDiff), num(p_.minFrameDiff)));
	}

	if (n >= 3) {
		// === 3) 차이의 분산/평균 (화면 재생은 균일함) ===
		const double dv = varianceOf(diffs);
		const double dm = meanOf(diffs);
		if (dv < p_.minDiffVariance || dm < p_.minDiffMean) {
			return fail(QString("Frame differences too uniform (variance %1, mean %2) - screen replay suspected")
							.arg(num(dv), num(dm)));
		}

		// === 4) 밝기/색 분산 ===
		std::vector<double> brightness, colorVar;
		for (const auto& m : rgb) {
			brightness.push_back(brightnessOf(m));
			colorVar.push_back(colorVarianceOf(m));
		}
		const double bv = varianceOf(brightness);
		if (bv < p_.minBrightnessVariance) {
			return fail(QString("Brightness too uniform across frames (variance %1) - static image suspected")
							.arg(num(bv)));
		}
		const double cr = rangeOf(colorVar);
		if (cr < p_.minColorVarianceRange) {
			return fail(QString("Color variation too uniform across frames (range %1) - static image suspected")
							.arg(num(cr)));
		}

		// === 5) 엣지 강도 분산 ===
		std::vector<double> edges;
		for (const auto& m : rgb) edges.push_back(edgeStrengthOf(m));
		const double ev = varianceOf(edges);
		if (ev < p_.minEdgeVariance) {
			return fail(QString("Edge strength too uniform across frames (variance %1) - static image suspected")
							.arg(num(ev)));
		}
	}

	return LivenessResult{};
}

LivenessResult LivenessGate::checkMovement(const std::vector<FaceBox>& boxes, int frameCount) const
{
	std::vector<double> tops, rights, bottoms, lefts, widths, heights, areas;
	for (const auto& b : boxes) {
		tops.push_back(b.top);
		rights.push_back(b.right);
		bottoms.push_back(b.bottom);
		lefts.push_back(b.left);
		widths.push_back(b.width());
		heights.push_back(b.height());
		areas.push_back(static_cast<double>(b.width()) * b.height());
	}

	// === 7) 위치/크기 변화 ===
	const std::vector<double> stds = {
		stdOf(tops), stdOf(rights), stdOf(bottoms), stdOf(lefts), stdOf(widths), stdOf(heights)
	};
	const double maxStd = *std::max_element(stds.begin(), stds.end());
	const double minStd = *std::min_element(stds.begin(), stds.end());
	qDebug() << "[LivenessGate] box std max=" << maxStd << "min=" << minStd;
	if (maxStd < p_.minBoxStd) {
		return fail(QString("No face movement detected (max variation %1) - static photo suspected")
						.arg(num(maxStd)));
	}
	const float confidence = static_cast<float>(std::min(1.0, maxStd / p_.confidenceScale));

	// === 8) 모든 방향으로 똑같은 움직임 ===
	if (maxStd - minStd < p_.minStdSpread) {
		return fail(QString("Face movement too uniform in every direction (spread %1) - synthetic motion suspected")
						.arg(num(maxStd - minStd)));
	}

	// === 9) 연속 박스 이동량 ===
	std::vector<double> movements;
	for (size_t i = 1; i < boxes.size(); ++i) {
		const auto& a = boxes[i - 1];
		const auto& b = boxes[i];
		movements.push_back(std::abs(b.top - a.top) + std::abs(b.right - a.right) +
							std::abs(b.bottom - a.bottom) + std::abs(b.left - a.left));
	}
	const double mv = varianceOf(movements);
	const double mm = meanOf(movements);
	if (mv < p_.minMovementVariance || mm < p_.minMovementMean) {
		return fail(QString("Movement pattern too uniform or too small (variance %1, mean %2) - please move naturally")
						.arg(num(mv), num(mm)));
	}

	// === 10) 박스 면적 ===
	const double av = varianceOf(areas);
	const double ar = rangeOf(areas);
	if (av < p_.minAreaVariance || ar < p_.minAreaRange) {
		return fail(QString("Face size did not change (area variance %1, range %2) - flat image suspected")
						.arg(num(av), num(ar)));
	}

	// === 11) 가속도 ===
	if (boxes.size() >= 4) {
		std::vector<double> accel;
		for (size_t i = 1; i < movements.size(); ++i) accel.push_back(movements[i] - movements[i - 1]);
		const double acv = varianceOf(accel);
		if (acv < p_.minAccelVariance) {
			return fail(QString("Movement acceleration too uniform (variance %1) - synthetic motion suspected")
							.arg(num(acv)));
		}
	}

	qDebug() << "[LivenessGate] movement ok over" << (int)boxes.size() << "/" << frameCount << "frames";

	LivenessResult r;
	r.isLive     = true;
	r.confidence = confidence;
	r.reason     = QStringLiteral("Liveness detected successfully");
	return r;
}
