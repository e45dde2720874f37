#include <gtest/gtest.h>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "logger.hpp"
#include "include/common_path.hpp"

namespace {

QString readAll(const QString& path)
{
	QFile f(path);
	if (!f.open(QIODevice::ReadOnly)) return QString();
	return QString::fromUtf8(f.readAll());
}

} // namespace

class LoggerTest : public ::testing::Test {
protected:
	void SetUp() override { ASSERT_TRUE(dir.isValid()); }
	void TearDown() override { Logger::configure(LOG_DIR, Logger::Level::Info); }

	QString file(const char* name) const { return dir.filePath(name); }

	QTemporaryDir dir;
};

TEST_F(LoggerTest, WritesAtOrAboveLevel)
{
	Logger::configure(dir.path().toStdString(), Logger::Level::Info);
	Logger::write(Logger::Level::Debug, "hidden line");
	Logger::write(Logger::Level::Info, "gallery loaded");

	const QString text = readAll(file(LOG_FILE_NAME));
	EXPECT_FALSE(text.contains("hidden line"));
	EXPECT_TRUE(text.contains(" - INFO - gallery loaded"));
}

TEST_F(LoggerTest, ErrorsAreMirroredToErrorLog)
{
	Logger::configure(dir.path().toStdString(), Logger::Level::Debug);
	Logger::write(Logger::Level::Warning, "slow query");
	Logger::write(Logger::Level::Error, "store read failed");

	const QString errors = readAll(file(ERROR_LOG_FILE_NAME));
	EXPECT_TRUE(errors.contains("ERROR - store read failed"));
	EXPECT_FALSE(errors.contains("slow query"));
	EXPECT_TRUE(readAll(file(LOG_FILE_NAME)).contains("WARNING - slow query"));
}

TEST_F(LoggerTest, RotatesWhenFileExceedsLimit)
{
	Logger::configure(dir.path().toStdString(), Logger::Level::Debug, 64, 2);
	for (int i = 0; i < 10; ++i) {
		Logger::write(Logger::Level::Info, "line number " + std::to_string(i) + " with some padding text");
	}

	EXPECT_TRUE(QFile::exists(file(LOG_FILE_NAME)));
	EXPECT_TRUE(QFile::exists(file(LOG_FILE_NAME ".1")));
	EXPECT_TRUE(QFile::exists(file(LOG_FILE_NAME ".2")));
	EXPECT_FALSE(QFile::exists(file(LOG_FILE_NAME ".3")));
	EXPECT_TRUE(readAll(file(LOG_FILE_NAME)).contains("line number 9"));
}

TEST_F(LoggerTest, ParsesLevelNames)
{
	bool ok = false;
	EXPECT_EQ(Logger::levelFromString("warn", &ok), Logger::Level::Warning);
	EXPECT_TRUE(ok);
	EXPECT_EQ(Logger::levelFromString(" Error ", &ok), Logger::Level::Error);
	Logger::levelFromString("verbose", &ok);
	EXPECT_FALSE(ok);
}

TEST_F(LoggerTest, MapsQtMessageTypes)
{
	EXPECT_EQ(Logger::levelOf(QtDebugMsg), Logger::Level::Debug);
	EXPECT_EQ(Logger::levelOf(QtInfoMsg), Logger::Level::Info);
	EXPECT_EQ(Logger::levelOf(QtWarningMsg), Logger::Level::Warning);
	EXPECT_EQ(Logger::levelOf(QtCriticalMsg), Logger::Level::Error);
	EXPECT_EQ(Logger::levelOf(QtFatalMsg), Logger::Level::Error);
}

TEST_F(LoggerTest, InstalledHandlerTeesQtMessages)
{
	Logger::configure(dir.path().toStdString(), Logger::Level::Warning);
	Logger::installMessageHandler();
	qInfo() << "below threshold";
	qWarning() << "gallery reload failed";
	qInstallMessageHandler(nullptr);

	const QString text = readAll(file(LOG_FILE_NAME));
	EXPECT_FALSE(text.contains("below threshold"));
	EXPECT_TRUE(text.contains("WARNING - gallery reload failed"));
}
