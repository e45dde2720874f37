#include <gtest/gtest.h>
#include <QTemporaryDir>
#include "codec/ImagePayload.hpp"
#include "extract/DescriptorExtractor.hpp"
#include "gallery/GalleryCache.hpp"
#include "liveness/LivenessGate.hpp"
#include "match/FaceMatcher.hpp"
#include "services/AttendanceRecognitionService.hpp"
#include "services/FaceDataRepository.hpp"
#include "services/QSqliteService.hpp"
#include "fakes.hpp"

// PixelEmbedding: R/100 -> d[0], G/100 -> d[1]
class RecognitionServiceTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_TRUE(dir.isValid());
		db = std::make_unique<QSqliteService>(dir.filePath("biometric.db"));
		ASSERT_TRUE(db->initializeDatabase());
		repo    = std::make_unique<FaceDataRepository>(*db);
		gallery = std::make_unique<GalleryCache>(*repo);
		service = std::make_unique<AttendanceRecognitionService>(extractor, *gallery, matcher, *repo, liveness);
	}

	QTemporaryDir dir;
	PixelKeyLocator locator;
	PixelEmbedding embedding;
	DescriptorExtractor extractor{ locator, embedding };
	FaceMatcher matcher;
	LivenessGate liveness{ locator };

	std::unique_ptr<QSqliteService> db;
	std::unique_ptr<FaceDataRepository> repo;
	std::unique_ptr<GalleryCache> gallery;
	std::unique_ptr<AttendanceRecognitionService> service;
};

TEST_F(RecognitionServiceTest, EmptyGalleryReportsNoEmployees)
{
	const RecognitionOutcome r = service->recognize(solidPng(10, 0, 0));
	EXPECT_EQ(r.status, RecognitionOutcome::Status::NoEmployees);
	EXPECT_EQ(r.message, QString("No registered employees found. Please contact administrator."));
}

TEST_F(RecognitionServiceTest, EnrollThenRecognize)
{
	ASSERT_TRUE(service->enroll(1, solidPng(10, 0, 0)).ok);		// A: (0.1, 0)
	ASSERT_TRUE(service->enroll(2, solidPng(90, 0, 0)).ok);		// B: (0.9, 0)

	const RecognitionOutcome a = service->recognize(solidPng(20, 0, 0));
	ASSERT_TRUE(a.recognized()) << a.message.toStdString();
	EXPECT_EQ(a.employeeId, 1);
	EXPECT_NEAR(a.distance, 0.1f, 1e-5f);

	const RecognitionOutcome b = service->recognize(solidPng(85, 0, 0));
	ASSERT_TRUE(b.recognized());
	EXPECT_EQ(b.employeeId, 2);
}

TEST_F(RecognitionServiceTest, UnrelatedFaceIsNotRecognized)
{
	ASSERT_TRUE(service->enroll(1, solidPng(10, 0, 0)).ok);

	const RecognitionOutcome r = service->recognize(solidPng(10, 200, 0));	// 거리 2.0
	EXPECT_EQ(r.status, RecognitionOutcome::Status::NotRecognized);
	EXPECT_EQ(r.employeeId, -1);
	EXPECT_TRUE(r.message.startsWith("Face not recognized."));
	EXPECT_TRUE(r.message.endsWith("(Similarity: -100.0%)")) << r.message.toStdString();
}

TEST_F(RecognitionServiceTest, NoFaceInQueryImage)
{
	ASSERT_TRUE(service->enroll(1, solidPng(10, 0, 0)).ok);

	const RecognitionOutcome r = service->recognize(solidPng(0, 0, 0));
	EXPECT_EQ(r.status, RecognitionOutcome::Status::NoFace);
	EXPECT_TRUE(r.message.startsWith("No face detected."));
}

TEST_F(RecognitionServiceTest, EnrollWithoutFaceIsRejected)
{
	const EnrollOutcome e = service->enroll(3, solidPng(0, 0, 0));
	EXPECT_FALSE(e.ok);
	EXPECT_EQ(e.message, QString("No face detected in image"));

	int n = -1;
	ASSERT_TRUE(repo->count(&n));
	EXPECT_EQ(n, 0);
}

TEST_F(RecognitionServiceTest, ReEnrollReplacesDescriptorImmediately)
{
	ASSERT_TRUE(service->enroll(1, solidPng(10, 0, 0)).ok);
	ASSERT_TRUE(service->recognize(solidPng(10, 0, 0)).recognized());

	// 캐시가 살아있어도 등록 직후 반영
	ASSERT_TRUE(service->enroll(1, solidPng(150, 0, 0)).ok);
	const RecognitionOutcome r = service->recognize(solidPng(150, 0, 0));
	ASSERT_TRUE(r.recognized());
	EXPECT_NEAR(r.distance, 0.0f, 1e-6f);
}

TEST_F(RecognitionServiceTest, RemovedEmployeeIsNoLongerMatched)
{
	ASSERT_TRUE(service->enroll(1, solidPng(10, 0, 0)).ok);
	ASSERT_TRUE(service->enroll(2, solidPng(90, 0, 0)).ok);
	ASSERT_TRUE(service->recognize(solidPng(10, 0, 0)).recognized());

	ASSERT_TRUE(service->removeEmployee(1));
	const RecognitionOutcome r = service->recognize(solidPng(10, 0, 0));
	EXPECT_EQ(r.status, RecognitionOutcome::Status::NotRecognized);
}

TEST_F(RecognitionServiceTest, MalformedPayloadThrows)
{
	EXPECT_THROW(service->recognize("%%%"), ImageDecodeError);
	EXPECT_THROW(service->enroll(1, ""), ImageDecodeError);
}

TEST_F(RecognitionServiceTest, LivenessNeedsEnoughFrames)
{
	const LivenessResult r = service->verifyLiveness({ solidPng(10, 0, 0), solidPng(20, 0, 0) });
	EXPECT_FALSE(r.isLive);
	EXPECT_TRUE(r.reason.contains("at least 5 frames"));
}
