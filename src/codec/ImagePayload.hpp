#pragma once
#include <stdexcept>
#include <string>
#include <QByteArray>
#include <QString>
#include <opencv2/core.hpp>

// base64/이미지 바이트를 해석할 수 없을 때 (해당 요청만 실패)
class ImageDecodeError : public std::runtime_error {
	public:
		explicit ImageDecodeError(const std::string& what) : std::runtime_error(what) {}
};

// 카메라/UI 에서 오는 "data:image/...;base64,xxxx" 또는 순수 base64
namespace ImagePayload {
	QString stripDataUrl(const QString& payload);

	// 원본 채널/비트 깊이 유지 (IMREAD_UNCHANGED)
	cv::Mat decodeBase64(const QString& payload);
	cv::Mat decodeBytes(const QByteArray& bytes);
}
