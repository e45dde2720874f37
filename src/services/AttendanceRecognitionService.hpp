#pragma once
#include <QString>
#include <QStringList>
#include "include/types.hpp"

class DescriptorExtractor;
class GalleryCache;
class FaceMatcher;
class FaceDataRepository;
class LivenessGate;

struct RecognitionOutcome {
	enum class Status {
		Recognized = 0,
		NoFace,
		NoEmployees,
		NotRecognized,
		Error
	};

	Status  status     = Status::Error;
	int     employeeId = -1;
	float   distance   = -1.0f;
	float   similarity = 0.0f;		// (1 - 거리) * 100
	QString message;

	bool recognized() const { return status == Status::Recognized; }
};

struct EnrollOutcome {
	bool    ok = false;
	QString message;
};

// 출퇴근 인식 흐름: 추출 -> 갤러리 -> 매칭
// 구성요소는 모두 참조로 받으며 소유하지 않음
class AttendanceRecognitionService {
	public:
		AttendanceRecognitionService(const DescriptorExtractor& extractor,
									 GalleryCache& gallery,
									 const FaceMatcher& matcher,
									 FaceDataRepository& repo,
									 const LivenessGate& liveness)
			: extractor_(extractor), gallery_(gallery), matcher_(matcher),
			  repo_(repo), liveness_(liveness) {}

		// payload 디코딩 실패는 ImageDecodeError 로 전파
		RecognitionOutcome recognize(const QString& payload);

		EnrollOutcome enroll(int employeeId, const QString& payload);
		bool removeEmployee(int employeeId);

		LivenessResult verifyLiveness(const QStringList& payloads) const;

		static const char* statusName(RecognitionOutcome::Status s);

	private:
		const DescriptorExtractor& extractor_;
		GalleryCache&              gallery_;
		const FaceMatcher&         matcher_;
		FaceDataRepository&        repo_;
		const LivenessGate&        liveness_;
};
