#pragma once
#include <QObject>
#include <QThread>

#include "include/LogDtos.hpp"

namespace syslog_detail { class SystemLogWriter; }

// 태그가 붙은 이벤트를 워커 스레드에서 system_logs 테이블에 기록
class SystemLogger final : public QObject {
    Q_OBJECT
public:
    static SystemLogger& instance();
    static void init(const QString& dbPath);      // 앱 시작시 1회
    static void shutdown();                       // 대기 중인 항목을 모두 기록한 뒤 종료

    // 어디서든 한 줄로 호출. init 전에는 무시된다
    static void info (const QString& tag, const QString& msg, const QString& extra = {});
    static void warn (const QString& tag, const QString& msg, const QString& extra = {});
    static void error(const QString& tag, const QString& msg, const QString& extra = {});
    static void critical(const QString& tag, const QString& msg, const QString& extra = {});

signals:
    void appendRequested(const SystemLogEntry& e); // 워커에게 보냄

private:
	QThread* th = nullptr;
	syslog_detail::SystemLogWriter* wr = nullptr;

    explicit SystemLogger(QObject* parent=nullptr);
    ~SystemLogger() override;

    friend void postSystemLog(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra);
};
