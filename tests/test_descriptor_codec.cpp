#include <gtest/gtest.h>
#include <cstring>
#include "codec/DescriptorCodec.hpp"
#include "fakes.hpp"

TEST(DescriptorCodecTest, EncodesAs512BytesOfFloat32)
{
	FaceDescriptor d{};
	for (size_t i = 0; i < kDescriptorDim; ++i) d[i] = static_cast<float>(i) * 0.01f;
	const QByteArray blob = DescriptorCodec::encode(d);
	ASSERT_EQ(blob.size(), DescriptorCodec::kFloat32Bytes);

	const auto back = DescriptorCodec::decode(blob, static_cast<int>(DescriptorCodec::currentEncoding()));
	ASSERT_TRUE(back.has_value());
	EXPECT_EQ(*back, d);
}

TEST(DescriptorCodecTest, DecodesLegacyFloat64)
{
	double legacy[kDescriptorDim] = {};
	legacy[0] = 0.25;
	legacy[127] = -1.5;
	QByteArray blob(reinterpret_cast<const char*>(legacy), sizeof(legacy));

	const auto d = DescriptorCodec::decode(blob, static_cast<int>(DescriptorEncoding::Float64Legacy));
	ASSERT_TRUE(d.has_value());
	EXPECT_FLOAT_EQ((*d)[0], 0.25f);
	EXPECT_FLOAT_EQ((*d)[127], -1.5f);
}

TEST(DescriptorCodecTest, UntaggedBlobsAreSniffedByLength)
{
	EXPECT_TRUE(DescriptorCodec::sniff(QByteArray(512, '\0')) == DescriptorEncoding::Float32V1);
	EXPECT_TRUE(DescriptorCodec::sniff(QByteArray(1024, '\0')) == DescriptorEncoding::Float64Legacy);
	EXPECT_FALSE(DescriptorCodec::sniff(QByteArray(100, '\0')).has_value());

	const QByteArray blob = DescriptorCodec::encode(descriptorAt(0.75f));
	const auto d = DescriptorCodec::decode(blob, static_cast<int>(DescriptorEncoding::Untagged));
	ASSERT_TRUE(d.has_value());
	EXPECT_FLOAT_EQ((*d)[0], 0.75f);
}

TEST(DescriptorCodecTest, RejectsWrongSizeOrUnknownTag)
{
	EXPECT_FALSE(DescriptorCodec::decode(QByteArray(1024, '\0'), 1).has_value());
	EXPECT_FALSE(DescriptorCodec::decode(QByteArray(512, '\0'), 2).has_value());
	EXPECT_FALSE(DescriptorCodec::decode(QByteArray(512, '\0'), 7).has_value());
	EXPECT_FALSE(DescriptorCodec::decode(QByteArray(), 0).has_value());
}
