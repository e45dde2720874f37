#include "SystemLogger.hpp"
#include <QThread>
#include <QDebug>
#include "services/QSqliteService.hpp"

namespace syslog_detail{
class SystemLogWriter : public QObject {
    Q_OBJECT
public:
    explicit SystemLogWriter(const QString& dbPath) : svc(dbPath) {}

public slots:
    void append(const SystemLogEntry& e) {
        if (!svc.insertSystemLog(
                static_cast<int>(e.level),
                e.tag,
                e.message,
                e.ts.isValid() ? e.ts : QDateTime::currentDateTime(),
                e.extra)) {
            qWarning() << "[SystemLogger] drop entry tag=" << e.tag << "msg=" << e.message;
        }
    }

private:
    QSqliteService svc;
};
} // namespace

SystemLogger& SystemLogger::instance() {
    static SystemLogger inst;
    return inst;
}

SystemLogger::SystemLogger(QObject* p) : QObject(p) {}

SystemLogger::~SystemLogger() {}

void SystemLogger::init(const QString& dbPath)
{
	auto& inst = instance();
	if (inst.th) return;

    qRegisterMetaType<SystemLogEntry>("SystemLogEntry");

	inst.th = new QThread;
	inst.wr = new syslog_detail::SystemLogWriter(dbPath);
	inst.wr->moveToThread(inst.th);

    QObject::connect(&inst, &SystemLogger::appendRequested,
                     inst.wr, &syslog_detail::SystemLogWriter::append, Qt::QueuedConnection);
    QObject::connect(inst.th, &QThread::finished, inst.wr, &QObject::deleteLater);
    inst.th->start();
}

void SystemLogger::shutdown() {
	auto& inst = instance();
 	if (!inst.th) return;

	QObject::disconnect(&inst, &SystemLogger::appendRequested, nullptr, nullptr);

	// 큐에 쌓인 append 뒤에 quit 을 넣어서 남은 로그를 먼저 처리
	QThread* th = inst.th;
	QMetaObject::invokeMethod(inst.wr, [th]{ th->quit(); }, Qt::QueuedConnection);
    if (!th->wait(3000)) {
        qWarning() << "[SystemLogger] writer thread did not stop, terminating";
        th->terminate();
        th->wait();
    }

    delete th;
    inst.th = nullptr;
	inst.wr = nullptr;
}

void postSystemLog(SysLogLevel lv, const QString& tag, const QString& msg, const QString& extra) {
    auto& inst = SystemLogger::instance();
    if (!inst.wr) return;
    SystemLogEntry e{lv, tag, msg, QDateTime::currentDateTime(), extra};
    emit inst.appendRequested(e);
}
void SystemLogger::info (const QString& tag, const QString& msg, const QString& extra){ postSystemLog(SysLogLevel::Info , tag, msg, extra); }
void SystemLogger::warn (const QString& tag, const QString& msg, const QString& extra){ postSystemLog(SysLogLevel::Warn , tag, msg, extra); }
void SystemLogger::error(const QString& tag, const QString& msg, const QString& extra){ postSystemLog(SysLogLevel::Error, tag, msg, extra); }
void SystemLogger::critical(const QString& tag, const QString& msg, const QString& extra){ postSystemLog(SysLogLevel::Critical, tag, msg, extra); }

#include "SystemLogger.moc"
