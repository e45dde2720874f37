#include <gtest/gtest.h>
#include "codec/ImagePayload.hpp"
#include "fakes.hpp"

TEST(ImagePayloadTest, DecodesPlainBase64Png)
{
	const cv::Mat img = ImagePayload::decodeBase64(solidPng(200, 100, 50, 40, 30));
	ASSERT_FALSE(img.empty());
	EXPECT_EQ(img.cols, 40);
	EXPECT_EQ(img.rows, 30);
	EXPECT_EQ(img.channels(), 3);
	const cv::Vec3b p = img.at<cv::Vec3b>(0, 0);
	EXPECT_EQ(p[0], 50);		// BGR
	EXPECT_EQ(p[2], 200);
}

TEST(ImagePayloadTest, AcceptsDataUrlPrefixAndLineBreaks)
{
	QString b64 = solidPng(10, 20, 30);
	b64.insert(20, "\n");
	const QString url = "data:image/png;base64," + b64;
	EXPECT_EQ(ImagePayload::stripDataUrl(url).left(10), b64.left(10));
	EXPECT_FALSE(ImagePayload::decodeBase64(url).empty());
}

TEST(ImagePayloadTest, KeepsAlphaChannel)
{
	cv::Mat bgra(8, 8, CV_8UC4, cv::Scalar(1, 2, 3, 128));
	const cv::Mat img = ImagePayload::decodeBase64(pngBase64(bgra));
	EXPECT_EQ(img.channels(), 4);
}

TEST(ImagePayloadTest, EmptyPayloadThrows)
{
	EXPECT_THROW(ImagePayload::decodeBase64(""), ImageDecodeError);
	EXPECT_THROW(ImagePayload::decodeBase64("data:image/png;base64,"), ImageDecodeError);
}

TEST(ImagePayloadTest, InvalidBase64Throws)
{
	EXPECT_THROW(ImagePayload::decodeBase64("@@not*base64@@"), ImageDecodeError);
}

TEST(ImagePayloadTest, NonImageBytesThrow)
{
	const QString b64 = QString::fromLatin1(QByteArray("hello, not an image").toBase64());
	EXPECT_THROW(ImagePayload::decodeBase64(b64), ImageDecodeError);
	EXPECT_THROW(ImagePayload::decodeBytes(QByteArray()), ImageDecodeError);
}
