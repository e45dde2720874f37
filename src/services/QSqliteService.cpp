#include "QSqliteService.hpp"
#include "services/SqlCommon.hpp"
#include <QSqlDatabase>
#include <QSqlDriver>
#include <QSqlError>
#include <QSqlQuery>
#include <QVariant>
#include <QDebug>
#include <utility>

// 호출 스레드 전용 커넥션 확보
static QSqlDatabase ensureOpenConnectionForThisThread(const QString& dbPath) {
    const QString name = SqlCommon::connectionNameFor(dbPath);
    QSqlDatabase db;

    if (!QSqlDatabase::contains(name)) {
        db = QSqlDatabase::addDatabase(QStringLiteral("QSQLITE"), name);
        db.setDatabaseName(dbPath);
    } else {
        db = QSqlDatabase::database(name, /*open=*/false);
        if (db.databaseName().isEmpty())
            db.setDatabaseName(dbPath);
    }

    if (!db.isOpen() && !db.open()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text()
                    << " path=" << db.databaseName()
                    << " drivers=" << QSqlDatabase::drivers();
    }
    return db;
}

static bool hasColumn(QSqlDatabase& db, const QString& table, const QString& column)
{
    QSqlQuery q(db);
    if (!q.exec(QString("PRAGMA table_info(%1)").arg(table))) return false;
    while (q.next()) {
        if (q.value(1).toString() == column) return true;
    }
    return false;
}

static void readFaceRows(QSqlQuery& q, QVector<StoredDescriptor>* outRows)
{
    outRows->clear();
    while (q.next()) {
        StoredDescriptor r;
        r.employeeId  = q.value(0).toInt();
        r.blob        = q.value(1).toByteArray();
        r.encodingTag = q.value(2).toInt();
        outRows->push_back(std::move(r));
    }
}

QSqliteService::QSqliteService(QString dbPath) : dbPath_(std::move(dbPath)) {}

bool QSqliteService::initializeDatabase()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCritical() << "[SQL] Open failed:" << db.lastError().text()
                    << " path=" << db.databaseName();
        return false;
    }

    {   // 신뢰성 옵션
        QSqlQuery pragma(db);
        if (!pragma.exec("PRAGMA journal_mode=WAL;"))
            qWarning() << "[SQL] journal_mode=WAL failed (ignored):" << pragma.lastError().text();
        if (!pragma.exec("PRAGMA synchronous=NORMAL;"))
            qWarning() << "[SQL] synchronous=NORMAL failed (ignored):" << pragma.lastError().text();
    }

    QSqlQuery q(db);

    // 얼굴 디스크립터
    if (!q.exec(
        "CREATE TABLE IF NOT EXISTS facial_data ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "employee_id INTEGER UNIQUE, "
        "face_encoding BLOB, "
        "encoding_version INTEGER NOT NULL DEFAULT 0, "
        "updated_at TEXT)"
    )) {
        qCritical() << "Failed to create facial_data:" << q.lastError().text();
        return false;
    }

    // 예전 스키마(encoding_version 없음) -> 컬럼 추가, 기존 행은 0(untagged)
    if (!hasColumn(db, "facial_data", "encoding_version")) {
        if (!q.exec("ALTER TABLE facial_data ADD COLUMN encoding_version INTEGER NOT NULL DEFAULT 0")) {
            qCritical() << "Failed to add encoding_version:" << q.lastError().text();
            return false;
        }
        qInfo() << "[SQL] facial_data upgraded with encoding_version column";
    }
    if (!hasColumn(db, "facial_data", "updated_at")) {
        if (!q.exec("ALTER TABLE facial_data ADD COLUMN updated_at TEXT")) {
            qCritical() << "Failed to add updated_at:" << q.lastError().text();
            return false;
        }
    }

    // 시스템로그
    if (!q.exec(
        "CREATE TABLE IF NOT EXISTS system_logs ("
        "id INTEGER PRIMARY KEY AUTOINCREMENT, "
        "level INTEGER NOT NULL, "
        "tag TEXT, "
        "message TEXT NOT NULL, "
        "timestamp TEXT NOT NULL, "
        "extra TEXT)"
    )) {
        qCritical() << "Failed to create system_logs:" << q.lastError().text();
        return false;
    }

    // 인덱스
    const char* indexes[] = {
        "CREATE INDEX IF NOT EXISTS idx_face_version ON facial_data(encoding_version)",
        "CREATE INDEX IF NOT EXISTS idx_sys_ts    ON system_logs(timestamp)",
        "CREATE INDEX IF NOT EXISTS idx_sys_level ON system_logs(level)",
        "CREATE INDEX IF NOT EXISTS idx_sys_tag   ON system_logs(tag)",
    };
    for (const char* sql : indexes) {
        if (!q.exec(sql))
            qWarning() << "[SQL] index create failed (ignored):" << q.lastError().text();
    }

    qDebug() << "[SQL] Database opened & schema ready. path=" << db.databaseName()
             << " driver=" << db.driverName();
    return true;
}

bool QSqliteService::upsertFaceData(int employeeId, const QByteArray& blob, int encodingTag)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO facial_data (employee_id, face_encoding, encoding_version, updated_at) "
              "VALUES (?, ?, ?, ?) "
              "ON CONFLICT(employee_id) DO UPDATE SET "
              "face_encoding = excluded.face_encoding, "
              "encoding_version = excluded.encoding_version, "
              "updated_at = excluded.updated_at");
    q.addBindValue(employeeId);
    q.addBindValue(blob);
    q.addBindValue(encodingTag);
    q.addBindValue(QDateTime::currentDateTime().toString(Qt::ISODateWithMs));

    if (!q.exec()) {
        qCritical() << "[SQL] upsert facial_data failed: employee=" << employeeId
                    << q.lastError().text();
        return false;
    }
    return true;
}

bool QSqliteService::deleteFaceData(int employeeId)
{
	QMutexLocker locker(&dbMutex);
	QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
	if (!db.isOpen()) {
		qCritical() << "[deleteFaceData] DB open failed:" << db.lastError().text();
		return false;
	}

	QSqlQuery q(db);
	q.prepare("DELETE FROM facial_data WHERE employee_id = ?");
	q.addBindValue(employeeId);
	if (!q.exec()) {
		qCritical() << "[deleteFaceData] delete failed: employee=" << employeeId << q.lastError().text();
		return false;
	}
	return true;
}

bool QSqliteService::selectAllFaceData(QVector<StoredDescriptor>* outRows)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    if (!q.exec("SELECT employee_id, face_encoding, encoding_version "
                "FROM facial_data WHERE employee_id IS NOT NULL ORDER BY employee_id")) {
        qCritical() << "[SQL] select facial_data failed:" << q.lastError().text();
        return false;
    }
    if (outRows) readFaceRows(q, outRows);
    return true;
}

bool QSqliteService::selectFaceDataByTag(int encodingTag, QVector<StoredDescriptor>* outRows)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    q.prepare("SELECT employee_id, face_encoding, encoding_version "
              "FROM facial_data WHERE employee_id IS NOT NULL AND encoding_version = ? "
              "ORDER BY employee_id");
    q.addBindValue(encodingTag);
    if (!q.exec()) {
        qCritical() << "[SQL] select facial_data by tag failed:" << q.lastError().text();
        return false;
    }
    if (outRows) readFaceRows(q, outRows);
    return true;
}

bool QSqliteService::countFaceData(int* outCount)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QSqlQuery q(db);
    if (!q.exec("SELECT COUNT(*) FROM facial_data WHERE employee_id IS NOT NULL") || !q.next()) {
        qCritical() << "[SQL] count facial_data failed:" << q.lastError().text();
        return false;
    }
    if (outCount) *outCount = q.value(0).toInt();
    return true;
}

bool QSqliteService::insertSystemLog(int level, const QString& tag, const QString& message,
                                     const QDateTime& timestamp, const QString& extra)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    q.prepare("INSERT INTO system_logs (level, tag, message, timestamp, extra) "
              "VALUES (?, ?, ?, ?, ?)");
    q.addBindValue(level);
    q.addBindValue(tag);
    q.addBindValue(message);
    q.addBindValue(timestamp.toString(Qt::ISODateWithMs));
    q.addBindValue(extra);

    if (!q.exec()) {
        qCritical() << "Insert system log failed:" << q.lastError().text();
        return false;
    }
    return true;
}

bool QSqliteService::selectSystemLogs(int offset, int limit,
                                      int minLevel, const QString& tagLike, const QString& sinceIso,
                                      QVector<SystemLog>* outRows, int* outTotal)
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) return false;

    QString where = "WHERE level >= ?";
    QList<QVariant> binds; binds << minLevel;

    if (!tagLike.isEmpty()) { where += " AND tag LIKE ?";      binds << ("%"+tagLike+"%"); }
    if (!sinceIso.isEmpty()){ where += " AND timestamp >= ?";  binds << sinceIso; }

    // total
    QSqlQuery qc(db);
    qc.prepare("SELECT COUNT(*) FROM system_logs " + where);
    for (auto& v : binds) qc.addBindValue(v);
    if (!qc.exec() || !qc.next()) return false;
    if (outTotal) *outTotal = qc.value(0).toInt();

    // rows
    QSqlQuery q(db);
    q.prepare("SELECT id, level, tag, message, timestamp, extra "
              "FROM system_logs " + where + " ORDER BY id DESC LIMIT ? OFFSET ?");
    for (auto& v : binds) q.addBindValue(v);
    q.addBindValue(limit);
    q.addBindValue(offset);

    if (!q.exec()) return false;

    if (outRows) {
        outRows->clear();
        while (q.next()) {
            SystemLog r;
            r.id        = q.value(0).toInt();
            r.level     = q.value(1).toInt();
            r.tag       = q.value(2).toString();
            r.message   = q.value(3).toString();
            r.timestamp = QDateTime::fromString(q.value(4).toString(), Qt::ISODateWithMs);
            r.extra     = q.value(5).toString();
            outRows->push_back(r);
        }
    }
    return true;
}

bool QSqliteService::deleteSysLogs()
{
	QMutexLocker locker(&dbMutex);
    QSqlDatabase db = ensureOpenConnectionForThisThread(dbPath_);
    if (!db.isOpen()) {
        qCritical() << "[SQL] DB open failed:" << db.lastError().text();
        return false;
    }

    QSqlQuery q(db);
    if (!q.exec("DELETE FROM system_logs;")) {
        qCritical() << "[SQL] DELETE FROM system_logs failed:" << q.lastError().text();
        return false;
    }

    if (!q.exec("DELETE FROM sqlite_sequence WHERE name='system_logs';")) {
        qWarning() << "[SQL] reset sqlite_sequence failed (ignored):" << q.lastError().text();
    }
    return true;
}
