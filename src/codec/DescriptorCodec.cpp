#include "codec/DescriptorCodec.hpp"
#include <QDebug>
#include <cstring>

QByteArray DescriptorCodec::encode(const FaceDescriptor& d)
{
	QByteArray out(kFloat32Bytes, Qt::Uninitialized);
	std::memcpy(out.data(), d.data(), static_cast<size_t>(kFloat32Bytes));
	return out;
}

std::optional<DescriptorEncoding> DescriptorCodec::sniff(const QByteArray& blob)
{
	if (blob.size() == kFloat32Bytes) return DescriptorEncoding::Float32V1;
	if (blob.size() == kFloat64Bytes) return DescriptorEncoding::Float64Legacy;
	return std::nullopt;
}

std::optional<FaceDescriptor> DescriptorCodec::decode(const QByteArray& blob, int encodingTag)
{
	DescriptorEncoding enc;
	switch (encodingTag) {
		case static_cast<int>(DescriptorEncoding::Untagged): {
			auto s = sniff(blob);
			if (!s) {
				qDebug() << "[DescriptorCodec] untagged blob with unexpected size" << blob.size();
				return std::nullopt;
			}
			enc = *s;
			break;
		}
		case static_cast<int>(DescriptorEncoding::Float32V1):
			enc = DescriptorEncoding::Float32V1;
			break;
		case static_cast<int>(DescriptorEncoding::Float64Legacy):
			enc = DescriptorEncoding::Float64Legacy;
			break;
		default:
			qDebug() << "[DescriptorCodec] unknown encoding tag" << encodingTag;
			return std::nullopt;
	}

	if (enc == DescriptorEncoding::Float32V1) {
		if (blob.size() != kFloat32Bytes) {
			qDebug() << "[DescriptorCodec] float32 blob size" << blob.size() << "!=" << kFloat32Bytes;
			return std::nullopt;
		}
		return fromFloat32(blob);
	}

	if (blob.size() != kFloat64Bytes) {
		qDebug() << "[DescriptorCodec] float64 blob size" << blob.size() << "!=" << kFloat64Bytes;
		return std::nullopt;
	}
	return fromFloat64(blob);
}

FaceDescriptor DescriptorCodec::fromFloat32(const QByteArray& blob)
{
	FaceDescriptor d{};
	std::memcpy(d.data(), blob.constData(), static_cast<size_t>(kFloat32Bytes));
	return d;
}

FaceDescriptor DescriptorCodec::fromFloat64(const QByteArray& blob)
{
	double tmp[kDescriptorDim];
	std::memcpy(tmp, blob.constData(), static_cast<size_t>(kFloat64Bytes));

	FaceDescriptor d{};
	for (size_t i = 0; i < kDescriptorDim; ++i) d[i] = static_cast<float>(tmp[i]);
	return d;
}
