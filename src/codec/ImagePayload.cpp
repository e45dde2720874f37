#include "codec/ImagePayload.hpp"
#include <QDebug>
#include <opencv2/imgcodecs.hpp>

namespace ImagePayload {

QString stripDataUrl(const QString& payload)
{
	const QString trimmed = payload.trimmed();
	if (trimmed.startsWith(QLatin1String("data:"), Qt::CaseInsensitive)) {
		const int comma = trimmed.indexOf(QLatin1Char(','));
		if (comma >= 0) return trimmed.mid(comma + 1);
	}
	return trimmed;
}

cv::Mat decodeBase64(const QString& payload)
{
	QByteArray raw = stripDataUrl(payload).toLatin1();
	// 줄바꿈/공백이 섞인 payload 허용
	raw.replace('\n', "").replace('\r', "").replace(' ', "").replace('\t', "");
	if (raw.isEmpty()) {
		throw ImageDecodeError("Image payload is empty");
	}

	const auto res = QByteArray::fromBase64Encoding(raw, QByteArray::AbortOnBase64DecodingErrors);
	if (res.decodingStatus != QByteArray::Base64DecodingStatus::Ok) {
		qWarning() << "[ImagePayload] invalid base64, length=" << raw.size();
		throw ImageDecodeError("Image payload is not valid base64");
	}
	return decodeBytes(res.decoded);
}

cv::Mat decodeBytes(const QByteArray& bytes)
{
	if (bytes.isEmpty()) {
		throw ImageDecodeError("Image data is empty");
	}

	cv::Mat buf(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<char*>(bytes.constData()));
	cv::Mat img;
	try {
		img = cv::imdecode(buf, cv::IMREAD_UNCHANGED);
	} catch (const cv::Exception& e) {
		qWarning() << "[ImagePayload] imdecode threw:" << e.what();
		throw ImageDecodeError(std::string("Image data could not be decoded: ") + e.what());
	}

	if (img.empty()) {
		qWarning() << "[ImagePayload] imdecode failed, bytes=" << bytes.size();
		throw ImageDecodeError("Image data could not be decoded");
	}
	return img;
}

} // namespace ImagePayload
