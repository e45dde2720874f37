#pragma once
#include <QByteArray>
#include <QDateTime>
#include <QVector>
#include <QString>
#include <QMutex>
#include "include/LogDtos.hpp"
#include "include/types.hpp"


class QSqliteService {
public:
    explicit QSqliteService(QString dbPath);

    bool initializeDatabase();

    // facial_data: 직원당 1행, 재등록 시 덮어쓰기
    bool upsertFaceData(int employeeId, const QByteArray& blob, int encodingTag);
    bool deleteFaceData(int employeeId);
    bool selectAllFaceData(QVector<StoredDescriptor>* outRows);
    bool selectFaceDataByTag(int encodingTag, QVector<StoredDescriptor>* outRows);
    bool countFaceData(int* outCount);

    // 시스템로그 입력
    bool insertSystemLog(int level, const QString& tag, const QString& message,
                         const QDateTime& timestamp, const QString& extra = QString());

    // 조회(페이징/필터)
    bool selectSystemLogs(int offset, int limit,
                          int minLevel, const QString& tagLike, const QString& sinceIso,
                          QVector<SystemLog>* outRows,
                          int* outTotal);

	bool deleteSysLogs();

private:
	QString dbPath_;
	QMutex dbMutex;
};
