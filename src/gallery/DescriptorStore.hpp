#pragma once
#include <vector>
#include "include/types.hpp"

// 갤러리의 원본 저장소 (DB). 한 번에 전체를 읽는다
class DescriptorStore {
	public:
		virtual ~DescriptorStore() = default;

		virtual bool loadAll(std::vector<StoredDescriptor>* out) = 0;
};
