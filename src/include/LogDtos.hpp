#pragma once
#include <QString>
#include <QDateTime>
#include <QMetaType>

enum class SysLogLevel { Debug=0, Info=1, Warn=2, Error=3, Critical=4 };

// SystemLogger -> 워커 스레드로 전달되는 항목
struct SystemLogEntry {
    SysLogLevel level;
    QString tag;        // 예: "GALLERY", "MATCH", "LIVENESS", "ENROLL", "APP"
    QString message;
    QDateTime ts;
    QString extra;
};

// system_logs 조회 DTO
struct SystemLog {
    int id{};
    int level{};        // 0~4
    QString tag;
    QString message;
    QDateTime timestamp;
    QString extra;
};

Q_DECLARE_METATYPE(SystemLogEntry)
