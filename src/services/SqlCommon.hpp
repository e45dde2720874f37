#pragma once
#include <QFileInfo>
#include <QHash>
#include <QString>
#include <QThread>

namespace SqlCommon {
	inline QString baseConnName() { return QStringLiteral("attendface"); }

    // 같은 스레드라도 DB 파일이 다르면 다른 커넥션
    inline QString connectionNameFor(const QString& dbPath)
    {
        return QString("%1_%2_%3").arg(baseConnName())
                                  .arg(static_cast<qulonglong>(reinterpret_cast<quintptr>(QThread::currentThreadId())))
                                  .arg(qHash(QFileInfo(dbPath).absoluteFilePath()));
    }
} // namespace SqlCommon
