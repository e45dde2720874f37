#pragma once
#include <optional>
#include <QByteArray>
#include "include/types.hpp"

// facial_data.encoding_version 값
enum class DescriptorEncoding : int {
	Untagged      = 0,		// 예전 행: 길이로 판별
	Float32V1     = 1,		// 512 bytes
	Float64Legacy = 2		// 1024 bytes, 로드 시 float32 로 변환
};

class DescriptorCodec {
	public:
		static constexpr int kFloat32Bytes = static_cast<int>(kDescriptorDim * sizeof(float));
		static constexpr int kFloat64Bytes = static_cast<int>(kDescriptorDim * sizeof(double));

		// 항상 Float32V1
		static QByteArray encode(const FaceDescriptor& d);
		static DescriptorEncoding currentEncoding() { return DescriptorEncoding::Float32V1; }

		// 태그와 길이가 맞지 않으면 nullopt
		static std::optional<FaceDescriptor> decode(const QByteArray& blob, int encodingTag);

		// untagged 행 전용: 512 -> float32, 1024 -> float64
		static std::optional<DescriptorEncoding> sniff(const QByteArray& blob);

	private:
		static FaceDescriptor fromFloat32(const QByteArray& blob);
		static FaceDescriptor fromFloat64(const QByteArray& blob);
};
