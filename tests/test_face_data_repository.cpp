#include <gtest/gtest.h>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>
#include <QVariant>
#include "codec/DescriptorCodec.hpp"
#include "gallery/GalleryCache.hpp"
#include "services/FaceDataRepository.hpp"
#include "services/QSqliteService.hpp"
#include "fakes.hpp"

namespace {

QByteArray float64Blob(double first)
{
	double v[kDescriptorDim] = {};
	v[0] = first;
	return QByteArray(reinterpret_cast<const char*>(v), sizeof(v));
}

} // namespace

class FaceDataRepositoryTest : public ::testing::Test {
protected:
	void SetUp() override {
		ASSERT_TRUE(dir.isValid());
		path = dir.filePath("biometric.db");
	}

	QTemporaryDir dir;
	QString path;
};

TEST_F(FaceDataRepositoryTest, SaveLoadAndReplace)
{
	QSqliteService db(path);
	ASSERT_TRUE(db.initializeDatabase());
	FaceDataRepository repo(db);

	ASSERT_TRUE(repo.saveDescriptor(2, descriptorAt(0.2f)));
	ASSERT_TRUE(repo.saveDescriptor(1, descriptorAt(0.1f)));
	ASSERT_TRUE(repo.saveDescriptor(2, descriptorAt(0.9f)));	// 재등록

	int n = 0;
	ASSERT_TRUE(repo.count(&n));
	EXPECT_EQ(n, 2);

	std::vector<StoredDescriptor> rows;
	ASSERT_TRUE(repo.loadAll(&rows));
	ASSERT_EQ(rows.size(), 2u);
	EXPECT_EQ(rows[0].employeeId, 1);
	EXPECT_EQ(rows[1].employeeId, 2);
	EXPECT_EQ(rows[1].encodingTag, static_cast<int>(DescriptorEncoding::Float32V1));
	const auto d = DescriptorCodec::decode(rows[1].blob, rows[1].encodingTag);
	ASSERT_TRUE(d.has_value());
	EXPECT_FLOAT_EQ((*d)[0], 0.9f);
}

TEST_F(FaceDataRepositoryTest, RemoveDeletesRow)
{
	QSqliteService db(path);
	ASSERT_TRUE(db.initializeDatabase());
	FaceDataRepository repo(db);

	ASSERT_TRUE(repo.saveDescriptor(5, descriptorAt(0.5f)));
	ASSERT_TRUE(repo.removeDescriptor(5));
	ASSERT_TRUE(repo.removeDescriptor(42));		// 없는 직원도 오류 아님

	int n = -1;
	ASSERT_TRUE(repo.count(&n));
	EXPECT_EQ(n, 0);
}

TEST_F(FaceDataRepositoryTest, GalleryReadsLegacyAndSkipsBrokenRows)
{
	QSqliteService db(path);
	ASSERT_TRUE(db.initializeDatabase());
	FaceDataRepository repo(db);

	ASSERT_TRUE(repo.saveDescriptor(1, descriptorAt(0.1f)));
	ASSERT_TRUE(db.upsertFaceData(2, float64Blob(0.25), 0));
	ASSERT_TRUE(db.upsertFaceData(3, QByteArray(77, 'x'), 0));

	GalleryCache cache(repo);
	const auto all = cache.getAll();
	ASSERT_EQ(all.size(), 2u);
	EXPECT_EQ(all[1].employeeId, 2);
	EXPECT_FLOAT_EQ(all[1].descriptor[0], 0.25f);
}

TEST_F(FaceDataRepositoryTest, MigrationRetagsLegacyRows)
{
	QSqliteService db(path);
	ASSERT_TRUE(db.initializeDatabase());
	FaceDataRepository repo(db);

	ASSERT_TRUE(db.upsertFaceData(1, float64Blob(0.5), 0));
	ASSERT_TRUE(db.upsertFaceData(2, DescriptorCodec::encode(descriptorAt(0.7f)), 0));
	ASSERT_TRUE(db.upsertFaceData(3, QByteArray(10, 'x'), 0));

	FaceDataRepository::MigrationReport rep;
	ASSERT_TRUE(repo.migrateLegacyRows(&rep));
	EXPECT_EQ(rep.migrated, 2);
	EXPECT_EQ(rep.broken, 1);

	std::vector<StoredDescriptor> rows;
	ASSERT_TRUE(repo.loadAll(&rows));
	ASSERT_EQ(rows.size(), 3u);
	EXPECT_EQ(rows[0].encodingTag, 1);
	EXPECT_EQ(rows[0].blob.size(), DescriptorCodec::kFloat32Bytes);
	EXPECT_EQ(rows[1].encodingTag, 1);
	EXPECT_EQ(rows[2].encodingTag, 0);

	// 두 번째 실행은 손상된 행만 다시 만남
	ASSERT_TRUE(repo.migrateLegacyRows(&rep));
	EXPECT_EQ(rep.migrated, 0);
	EXPECT_EQ(rep.broken, 1);
}

TEST_F(FaceDataRepositoryTest, UpgradesTableWithoutVersionColumn)
{
	{
		QSqlDatabase raw = QSqlDatabase::addDatabase("QSQLITE", "legacy_setup");
		raw.setDatabaseName(path);
		ASSERT_TRUE(raw.open());
		QSqlQuery q(raw);
		ASSERT_TRUE(q.exec("CREATE TABLE facial_data ("
						   "id INTEGER PRIMARY KEY AUTOINCREMENT, "
						   "employee_id INTEGER UNIQUE, "
						   "face_encoding BLOB)"));
		ASSERT_TRUE(q.prepare("INSERT INTO facial_data (employee_id, face_encoding) VALUES (?, ?)"));
		q.addBindValue(9);
		q.addBindValue(float64Blob(0.125));
		ASSERT_TRUE(q.exec());
		raw.close();
	}
	QSqlDatabase::removeDatabase("legacy_setup");

	QSqliteService db(path);
	ASSERT_TRUE(db.initializeDatabase());
	FaceDataRepository repo(db);

	std::vector<StoredDescriptor> rows;
	ASSERT_TRUE(repo.loadAll(&rows));
	ASSERT_EQ(rows.size(), 1u);
	EXPECT_EQ(rows[0].employeeId, 9);
	EXPECT_EQ(rows[0].encodingTag, 0);

	const auto d = DescriptorCodec::decode(rows[0].blob, rows[0].encodingTag);
	ASSERT_TRUE(d.has_value());
	EXPECT_FLOAT_EQ((*d)[0], 0.125f);
}

TEST_F(FaceDataRepositoryTest, SystemLogsCanBeListedAndCleared)
{
	QSqliteService db(path);
	ASSERT_TRUE(db.initializeDatabase());

	const QDateTime now = QDateTime::currentDateTime();
	ASSERT_TRUE(db.insertSystemLog(1, "MATCH", "first", now));
	ASSERT_TRUE(db.insertSystemLog(3, "GALLERY", "second", now, "bytes=10"));

	QVector<SystemLog> logs;
	int total = 0;
	ASSERT_TRUE(db.selectSystemLogs(0, 10, 0, QString(), QString(), &logs, &total));
	EXPECT_EQ(total, 2);
	ASSERT_EQ(logs.size(), 2);
	EXPECT_EQ(logs[0].message, QString("second"));	// 최신순
	EXPECT_EQ(logs[0].extra, QString("bytes=10"));

	ASSERT_TRUE(db.selectSystemLogs(0, 10, 2, QString(), QString(), &logs, &total));
	EXPECT_EQ(total, 1);

	ASSERT_TRUE(db.deleteSysLogs());
	ASSERT_TRUE(db.selectSystemLogs(0, 10, 0, QString(), QString(), &logs, &total));
	EXPECT_EQ(total, 0);
}
