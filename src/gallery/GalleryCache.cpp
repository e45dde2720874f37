#include "gallery/GalleryCache.hpp"
#include "codec/DescriptorCodec.hpp"
#include "log/SystemLogger.hpp"
#include <QtCore/QDebug>
#include <QMutexLocker>
#include <utility>

GalleryCache::GalleryCache(DescriptorStore& store, std::chrono::seconds ttl, Clock clock)
	: store_(store), ttl_(ttl), clock_(std::move(clock))
{
	if (!clock_) clock_ = [] { return std::chrono::steady_clock::now(); };
}

std::vector<GalleryEntry> GalleryCache::getAll()
{
	QMutexLocker lk(&mtx_);
	const auto now = clock_();

	if (loadedAt_ && !snapshot_.empty()) {
		const auto age = now - *loadedAt_;
		if (age < ttl_) {
			qDebug() << "[GalleryCache] using cached descriptors, age(ms)="
					 << (qint64)std::chrono::duration_cast<std::chrono::milliseconds>(age).count();
			return snapshot_;
		}
	}

	qDebug() << "[GalleryCache] cache miss - loading descriptors from store";
	if (!reloadLocked(now)) {
		// 읽기 실패: 이전 스냅샷 유지
		qWarning() << "[GalleryCache] reload failed, serving previous snapshot size=" << (int)snapshot_.size();
	}
	return snapshot_;
}

bool GalleryCache::reloadLocked(std::chrono::steady_clock::time_point now)
{
	std::vector<StoredDescriptor> rows;
	if (!store_.loadAll(&rows)) {
		SystemLogger::error("GALLERY", "descriptor store read failed");
		return false;
	}

	std::vector<GalleryEntry> fresh;
	fresh.reserve(rows.size());
	int skipped = 0;
	for (const auto& row : rows) {
		auto d = DescriptorCodec::decode(row.blob, row.encodingTag);
		if (!d) {
			// 손상/예전 데이터 1건 때문에 전체 인식을 막지 않음
			++skipped;
			qWarning() << "[GalleryCache] skip employee" << row.employeeId
					   << "bytes=" << row.blob.size() << "tag=" << row.encodingTag;
			SystemLogger::warn("GALLERY",
							   QString("Skipping malformed descriptor for employee %1").arg(row.employeeId),
							   QString("bytes=%1 tag=%2").arg(row.blob.size()).arg(row.encodingTag));
			continue;
		}
		fresh.push_back(GalleryEntry{ row.employeeId, *d });
	}

	snapshot_ = std::move(fresh);
	loadedAt_ = now;
	++reloads_;

	qInfo() << "[GalleryCache] loaded" << (int)snapshot_.size() << "descriptors, skipped" << skipped;
	return true;
}

void GalleryCache::invalidate()
{
	QMutexLocker lk(&mtx_);
	snapshot_.clear();
	loadedAt_.reset();
	qInfo() << "[GalleryCache] cache cleared";
}

int GalleryCache::reloadCount() const
{
	QMutexLocker lk(&mtx_);
	return reloads_;
}
