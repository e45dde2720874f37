#include "Embedder.hpp"
#include <algorithm>
#include <filesystem>
#include <cstring>
#include <QDebug>
#include <QStringList>
#include <opencv2/imgproc.hpp>

using namespace cv;
namespace fs = std::filesystem;

Embedder::Embedder(const Options& opt) : opt_(opt)
{
	qDebug() << "[Embedder] ctor path=" << opt_.modelPath;

	const std::string path = opt_.modelPath.toStdString();
	if (!fs::exists(path)) {
		qWarning() << "[Embedder] model file not found:" << opt_.modelPath;
		return;
	}

	try {
		net_ = dnn::readNetFromONNX(path);
		net_.setPreferableBackend(dnn::DNN_BACKEND_OPENCV);
		net_.setPreferableTarget(dnn::DNN_TARGET_CPU);
		ready_ = true;

		// 출력 레이어 로그
		QStringList qn;
		for (auto& s : net_.getUnconnectedOutLayersNames())
			qn << QString::fromStdString(s);
		qDebug() << "[Embedder] out names =" << qn;

	} catch (const cv::Exception& e) {
		qWarning() << "[Embedder] readNetFromONNX failed:" << e.what();
		ready_ = false;
	}
}

bool Embedder::isReady() const { return ready_; }

cv::Rect Embedder::expandRect(const cv::Rect& r, float scale, const cv::Size& imgSz)
{
	const float cx = r.x + r.width  * 0.5f;
	const float cy = r.y + r.height * 0.5f;
	const float side = std::max(r.width, r.height) * scale;

	cv::Rect out(cvRound(cx - side * 0.5f), cvRound(cy - side * 0.5f),
				 cvRound(side), cvRound(side));
	return out & cv::Rect(0, 0, imgSz.width, imgSz.height);
}

cv::Mat Embedder::preprocess(const cv::Mat& src) const
{
    if (src.empty() || src.type() != CV_8UC3) {
        qWarning() << "[preprocess] ERR: src type/channels invalid"
                   << " type=" << src.type() << " ch=" << src.channels();
        return cv::Mat();
    }

    //   SFace: RGB 입력, 112x112, scale/mean 은 모델 내부 처리
	//   output: (N,C,H,W)
    const int S = opt_.inputSize;
	double scale = 1.0;
	cv::Scalar mean(0, 0, 0);
	if (opt_.norm == Options::Norm::MinusOneToOne) {
		scale = 1.0 / 128;
		mean = cv::Scalar(127.5, 127.5, 127.5);
	}

    // 입력이 이미 RGB 이므로 swapRB=false
    cv::Mat blob = cv::dnn::blobFromImage(src, scale, cv::Size(S, S), mean,
                                          /*swapRB=*/false, /*crop=*/false, CV_32F);

    if (blob.dims != 4 || blob.size[0] != 1 || blob.size[1] != 3 || blob.size[2] != S || blob.size[3] != S) {
        qWarning() << "[preprocess] ERR: unexpected blob shape";
        return cv::Mat();
    }
    return blob; // NCHW 1x3xSxS
}

void Embedder::l2normalize(Mat& row)
{
		double n = norm(row, NORM_L2);
		if (n > 1e-12) row /= static_cast<float>(n);
}

// 호출 측에서 mtx_ 보유
cv::Mat Embedder::forward(const cv::Mat& face_rgb) const
{
	cv::Mat blob = preprocess(face_rgb);
	if (blob.empty()) return cv::Mat();

	net_.setInput(blob);
	cv::Mat emb = net_.forward();
	if (emb.empty() || emb.total() == 0) {
		qCritical() << "[extract] forward empty.";
		return cv::Mat();
	}

	emb = emb.reshape(1, 1).clone();
	if (emb.type() != CV_32F) emb.convertTo(emb, CV_32F);
	return emb;
}

bool Embedder::extract(const cv::Mat& face_rgb, FaceDescriptor& out) const
{
    if (!ready_) {
        qWarning() << "[extract] embedder not ready";
        return false;
    }
    std::lock_guard<std::mutex> lk(mtx_);

    try {
        cv::Mat emb = forward(face_rgb);
        if (emb.empty()) return false;

        if (opt_.flipTTA) {
            cv::Mat flipped; cv::flip(face_rgb, flipped, 1);
            cv::Mat emb2 = forward(flipped);
            if (emb2.empty() || emb2.cols != emb.cols) {
                qCritical() << "[extract] flip forward failed";
                return false;
            }
            emb = 0.5f * (emb + emb2);
        }

        if (emb.cols != static_cast<int>(kDescriptorDim)) {
            qCritical() << "[extract] model dim" << emb.cols << "!=" << (int)kDescriptorDim;
            return false;
        }

        l2normalize(emb);
        std::memcpy(out.data(), emb.ptr<float>(0), kDescriptorDim * sizeof(float));
        return true;
    }
    catch (const cv::Exception& e) {
        qCritical() << "[extract][cv::Exception]" << e.what();
        return false;
    }
}

bool Embedder::embed(const cv::Mat& rgb, const FaceBox& box, FaceDescriptor& out) const
{
	const cv::Rect roi = expandRect(box.toRect(), opt_.boxScale, rgb.size());
	if (roi.width <= 0 || roi.height <= 0) {
		qWarning() << "[Embedder] face box outside frame";
		return false;
	}
	return extract(rgb(roi), out);
}
