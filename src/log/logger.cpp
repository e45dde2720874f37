#include "logger.hpp"
#include "include/common_path.hpp"
#include <QDateTime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace {

struct LogState {
		std::mutex   mtx;
		std::string  dir      = LOG_DIR;
		Logger::Level minLevel = Logger::Level::Info;
		qint64       maxBytes = 10 * 1024 * 1024;
		int          backups  = 5;
		QtMessageHandler prev = nullptr;
};

LogState& state()
{
		static LogState s;
		return s;
}

const char* levelName(Logger::Level lv)
{
		switch (lv) {
			case Logger::Level::Debug:   return "DEBUG";
			case Logger::Level::Info:    return "INFO";
			case Logger::Level::Warning: return "WARNING";
			case Logger::Level::Error:   return "ERROR";
		}
		return "INFO";
}

// name.log -> name.log.1 -> ... -> name.log.N (가장 오래된 것은 삭제)
void rotateIfNeeded(const fs::path& file, qint64 maxBytes, int backups)
{
		std::error_code ec;
		if (!fs::exists(file, ec)) return;
		const auto size = fs::file_size(file, ec);
		if (ec || static_cast<qint64>(size) < maxBytes) return;

		for (int i = backups - 1; i >= 1; --i) {
				fs::path from = file.string() + "." + std::to_string(i);
				fs::path to   = file.string() + "." + std::to_string(i + 1);
				if (fs::exists(from, ec)) fs::rename(from, to, ec);
		}
		if (backups > 0) {
				fs::rename(file, file.string() + ".1", ec);
		} else {
				fs::remove(file, ec);
		}
}

void appendLine(const fs::path& file, const std::string& line, qint64 maxBytes, int backups)
{
		rotateIfNeeded(file, maxBytes, backups);

		std::ofstream out(file, std::ios::app);
		if (!out.is_open()) {
				std::cerr << "[Logger] log file open failed: " << file << std::endl;
				return;
		}
		out << line << std::endl;
}

void messageHandler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
		if (QtMessageHandler prev = state().prev) {
				prev(type, ctx, msg);
		} else {
				std::cerr << qFormatLogMessage(type, ctx, msg).toStdString() << std::endl;
		}
		Logger::write(Logger::levelOf(type), msg.toStdString());
}

} // namespace

void Logger::configure(const std::string& logDir, Level minLevel, qint64 maxBytes, int backupCount)
{
		auto& s = state();
		std::lock_guard<std::mutex> lk(s.mtx);
		s.dir      = logDir;
		s.minLevel = minLevel;
		s.maxBytes = maxBytes;
		s.backups  = backupCount;
}

void Logger::installMessageHandler()
{
		auto& s = state();
		QtMessageHandler prev = qInstallMessageHandler(messageHandler);
		std::lock_guard<std::mutex> lk(s.mtx);
		if (prev != messageHandler) s.prev = prev;
}

void Logger::write(const std::string& message)
{
		write(Level::Info, message);
}

void Logger::write(Level level, const std::string& message)
{
		auto& s = state();
		std::lock_guard<std::mutex> lk(s.mtx);
		if (static_cast<int>(level) < static_cast<int>(s.minLevel)) return;

		std::error_code ec;
		// 디렉토리가 없으면 생성
		fs::create_directories(s.dir, ec);
		if (ec) {
				std::cerr << "[Logger] log directory create failed: " << s.dir << " " << ec.message() << std::endl;
				return;
		}

		const std::string timeStr =
				QDateTime::currentDateTime().toString(QStringLiteral("yyyy-MM-dd HH:mm:ss")).toStdString();
		const std::string line = timeStr + " - " + levelName(level) + " - " + message;

		const fs::path dir(s.dir);
		appendLine(dir / LOG_FILE_NAME, line, s.maxBytes, s.backups);
		if (level == Level::Error) {
				appendLine(dir / ERROR_LOG_FILE_NAME, line, s.maxBytes, s.backups);
		}
}

Logger::Level Logger::levelFromString(const QString& name, bool* ok)
{
		const QString n = name.trimmed().toLower();
		if (ok) *ok = true;
		if (n == "debug")                     return Level::Debug;
		if (n == "info")                      return Level::Info;
		if (n == "warning" || n == "warn")    return Level::Warning;
		if (n == "error" || n == "critical")  return Level::Error;
		if (ok) *ok = false;
		return Level::Info;
}

Logger::Level Logger::levelOf(QtMsgType type)
{
		switch (type) {
			case QtDebugMsg:    return Level::Debug;
			case QtInfoMsg:     return Level::Info;
			case QtWarningMsg:  return Level::Warning;
			case QtCriticalMsg: return Level::Error;
			case QtFatalMsg:    return Level::Error;
		}
		return Level::Info;
}
