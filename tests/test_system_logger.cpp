#include <gtest/gtest.h>
#include <QTemporaryDir>
#include "log/SystemLogger.hpp"
#include "services/QSqliteService.hpp"

TEST(SystemLoggerTest, IgnoresEntriesBeforeInit)
{
	SystemLogger::info("APP", "nobody listening");
	SystemLogger::shutdown();
	SUCCEED();
}

TEST(SystemLoggerTest, ShutdownFlushesPendingEntries)
{
	QTemporaryDir dir;
	ASSERT_TRUE(dir.isValid());
	const QString path = dir.filePath("biometric.db");

	QSqliteService db(path);
	ASSERT_TRUE(db.initializeDatabase());

	SystemLogger::init(path);
	for (int i = 0; i < 20; ++i) {
		SystemLogger::info("MATCH", QString("event %1").arg(i));
	}
	SystemLogger::warn("GALLERY", "Skipping malformed descriptor", "bytes=3");
	SystemLogger::shutdown();

	QVector<SystemLog> rows;
	int total = 0;
	ASSERT_TRUE(db.selectSystemLogs(0, 100, 0, QString(), QString(), &rows, &total));
	EXPECT_EQ(total, 21);
	ASSERT_FALSE(rows.isEmpty());
	EXPECT_EQ(rows.front().tag, QString("GALLERY"));
	EXPECT_EQ(rows.front().level, static_cast<int>(SysLogLevel::Warn));

	ASSERT_TRUE(db.selectSystemLogs(0, 100, 0, "MATCH", QString(), &rows, &total));
	EXPECT_EQ(total, 20);
}
