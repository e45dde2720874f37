#include "services/FaceDataRepository.hpp"
#include "services/QSqliteService.hpp"
#include "codec/DescriptorCodec.hpp"
#include "log/SystemLogger.hpp"
#include <QtCore/QDebug>

bool FaceDataRepository::loadAll(std::vector<StoredDescriptor>* out)
{
	QVector<StoredDescriptor> rows;
	if (!db_.selectAllFaceData(&rows)) return false;

	if (out) out->assign(rows.begin(), rows.end());
	return true;
}

bool FaceDataRepository::saveDescriptor(int employeeId, const FaceDescriptor& d)
{
	const QByteArray blob = DescriptorCodec::encode(d);
	const int tag = static_cast<int>(DescriptorCodec::currentEncoding());
	if (!db_.upsertFaceData(employeeId, blob, tag)) return false;

	qInfo() << "[FaceDataRepository] descriptor saved for employee" << employeeId;
	return true;
}

bool FaceDataRepository::removeDescriptor(int employeeId)
{
	return db_.deleteFaceData(employeeId);
}

bool FaceDataRepository::count(int* out)
{
	return db_.countFaceData(out);
}

bool FaceDataRepository::migrateLegacyRows(MigrationReport* report)
{
	MigrationReport rep;
	QVector<StoredDescriptor> rows;
	if (!db_.selectFaceDataByTag(static_cast<int>(DescriptorEncoding::Untagged), &rows)) {
		qCritical() << "[FaceDataRepository] legacy rows query failed";
		return false;
	}

	for (const auto& row : rows) {
		auto d = DescriptorCodec::decode(row.blob, row.encodingTag);
		if (!d) {
			++rep.broken;
			qWarning() << "[FaceDataRepository] legacy row for employee" << row.employeeId
					   << "is not a descriptor, bytes=" << row.blob.size();
			continue;
		}
		if (!saveDescriptor(row.employeeId, *d)) {
			if (report) *report = rep;
			return false;
		}
		++rep.migrated;
	}

	if (rep.migrated > 0 || rep.broken > 0) {
		SystemLogger::info("GALLERY",
						   QString("Legacy descriptor migration: %1 migrated, %2 left untouched")
								   .arg(rep.migrated).arg(rep.broken));
	}
	qInfo() << "[FaceDataRepository] migration done migrated=" << rep.migrated << "broken=" << rep.broken;
	if (report) *report = rep;
	return true;
}
