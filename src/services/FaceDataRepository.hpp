#pragma once
#include "gallery/DescriptorStore.hpp"
#include "include/types.hpp"

class QSqliteService;

// facial_data 테이블 <-> 디스크립터
class FaceDataRepository : public DescriptorStore {
	public:
		explicit FaceDataRepository(QSqliteService& db) : db_(db) {}

		bool loadAll(std::vector<StoredDescriptor>* out) override;

		// 재등록이면 기존 행을 덮어씀. 항상 현재 인코딩(float32 v1)으로 저장
		bool saveDescriptor(int employeeId, const FaceDescriptor& d);
		bool removeDescriptor(int employeeId);
		bool count(int* out);

		struct MigrationReport {
			int migrated = 0;		// 태그 붙여 다시 저장
			int broken   = 0;		// 해석 불가, 그대로 둠
		};

		// untagged 행을 길이로 판별해서 float32 v1 로 재인코딩 (1회성)
		bool migrateLegacyRows(MigrationReport* report);

	private:
		QSqliteService& db_;
};
