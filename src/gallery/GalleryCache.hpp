#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <vector>
#include <QMutex>
#include "gallery/DescriptorStore.hpp"
#include "include/recog_params.hpp"
#include "include/types.hpp"

// 프로세스당 1개. 인식 요청 스레드들이 공유한다
class GalleryCache {
	public:
		using Clock = std::function<std::chrono::steady_clock::time_point()>;

		explicit GalleryCache(DescriptorStore& store,
							  std::chrono::seconds ttl = std::chrono::seconds(recog::GALLERY_TTL_SEC),
							  Clock clock = {});

		// TTL 안이고 비어있지 않으면 캐시 복사본, 아니면 저장소에서 다시 읽음
		std::vector<GalleryEntry> getAll();

		// 다음 getAll() 은 무조건 다시 읽음 (등록/삭제 후)
		void invalidate();

		int reloadCount() const;
		std::chrono::seconds ttl() const { return ttl_; }

	private:
		bool reloadLocked(std::chrono::steady_clock::time_point now);

	private:
		DescriptorStore& store_;
		const std::chrono::seconds ttl_;
		Clock clock_;

		mutable QMutex mtx_;
		std::vector<GalleryEntry> snapshot_;
		std::optional<std::chrono::steady_clock::time_point> loadedAt_;
		int reloads_ = 0;
};
