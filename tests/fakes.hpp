#pragma once
#include <chrono>
#include <functional>
#include <vector>
#include <QString>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include "ai/FaceEmbedding.hpp"
#include "detect/FaceLocator.hpp"
#include "gallery/DescriptorStore.hpp"
#include "include/types.hpp"

// 호출 순서대로 미리 정한 박스를 돌려줌 (빈 박스 = 얼굴 없음)
class ScriptedLocator : public FaceLocator {
public:
	explicit ScriptedLocator(std::vector<FaceBox> script) : script_(std::move(script)) {}

	std::vector<FaceBox> locate(const cv::Mat&) const override {
		const size_t i = calls_++;
		if (i >= script_.size()) return {};
		const FaceBox& b = script_[i];
		if (b == FaceBox{}) return {};
		return { b };
	}

	size_t calls() const { return calls_; }

private:
	std::vector<FaceBox> script_;
	mutable size_t calls_ = 0;
};

// (0,0) 픽셀이 검정이면 얼굴 없음, 아니면 이미지 전체가 얼굴
class PixelKeyLocator : public FaceLocator {
public:
	std::vector<FaceBox> locate(const cv::Mat& rgb) const override {
		++calls;
		const cv::Vec3b p = rgb.at<cv::Vec3b>(0, 0);
		if (p[0] == 0 && p[1] == 0 && p[2] == 0) return {};
		return { FaceBox{ 0, rgb.cols, rgb.rows, 0 } };
	}

	mutable int calls = 0;
};

// 박스 왼쪽 위 픽셀의 R,G 를 100 으로 나눠 d[0], d[1] 에 넣음
class PixelEmbedding : public FaceEmbedding {
public:
	bool embed(const cv::Mat& rgb, const FaceBox& box, FaceDescriptor& out) const override {
		if (fail) return false;
		const cv::Vec3b p = rgb.at<cv::Vec3b>(box.top, box.left);
		out.fill(0.0f);
		out[0] = p[0] / 100.0f;
		out[1] = p[1] / 100.0f;
		return true;
	}

	bool fail = false;
};

class FakeStore : public DescriptorStore {
public:
	bool loadAll(std::vector<StoredDescriptor>* out) override {
		++loads;
		if (failNext) return false;
		if (out) *out = rows;
		return true;
	}

	std::vector<StoredDescriptor> rows;
	bool failNext = false;
	int loads = 0;
};

class ManualClock {
public:
	std::chrono::steady_clock::time_point now{ std::chrono::seconds(1000) };

	void advance(std::chrono::seconds s) { now += s; }

	std::function<std::chrono::steady_clock::time_point()> fn() {
		return [this] { return now; };
	}
};

// d[0] = x, 나머지 0
inline FaceDescriptor descriptorAt(float x, float y = 0.0f)
{
	FaceDescriptor d{};
	d[0] = x;
	d[1] = y;
	return d;
}

// 단색 BGR 이미지를 PNG -> base64 로
inline QString pngBase64(const cv::Mat& bgr)
{
	std::vector<uchar> buf;
	cv::imencode(".png", bgr, buf);
	const QByteArray bytes(reinterpret_cast<const char*>(buf.data()), static_cast<int>(buf.size()));
	return QString::fromLatin1(bytes.toBase64());
}

inline QString solidPng(int r, int g, int b, int w = 32, int h = 24)
{
	return pngBase64(cv::Mat(h, w, CV_8UC3, cv::Scalar(b, g, r)));
}
