// logger.h
#pragma once
#include <string>
#include <QString>
#include <QDebug>
#include <QtGlobal>

// 파일 로그 (Qt 메시지 핸들러에 연결해서 사용)
class Logger {
public:
		enum class Level { Debug = 0, Info, Warning, Error };

		// logDir 아래 attendface.log / error.log 사용
		static void configure(const std::string& logDir, Level minLevel,
							  qint64 maxBytes = 10 * 1024 * 1024, int backupCount = 5);

		// qDebug/qInfo/... 를 파일로도 남김 (콘솔 출력은 기존 핸들러 유지)
		static void installMessageHandler();

		static void write(const std::string& message);
		static void write(Level level, const std::string& message);

		static Level levelFromString(const QString& name, bool* ok = nullptr);
		static Level levelOf(QtMsgType type);
};

namespace GlobalLogger {

inline void logMessage(QtMsgType type, const QString& functionName, const QString& message)
{
		QString fullMsg = QString("[%1] %2").arg(functionName, message);

		switch (type) {
			case QtDebugMsg:
					qDebug().noquote() << fullMsg;
					break;
			case QtInfoMsg:
					qInfo().noquote() << fullMsg;
					break;
			case QtWarningMsg:
					qWarning().noquote() << fullMsg;
					break;
			case QtCriticalMsg:
					qCritical().noquote() << fullMsg;
					break;
			case QtFatalMsg:
					qFatal("%s", fullMsg.toUtf8().constData());
					break;
		}
}

}		// namespace GlobalLogger

#define LOG_DEBUG(msg)		GlobalLogger::logMessage(QtDebugMsg, __FUNCTION__, msg)
#define LOG_INFO(msg)			GlobalLogger::logMessage(QtInfoMsg, __FUNCTION__, msg)
#define LOG_WARN(msg)			GlobalLogger::logMessage(QtWarningMsg, __FUNCTION__, msg)
#define LOG_CRITICAL(msg) GlobalLogger::logMessage(QtCriticalMsg, __FUNCTION__, msg)
