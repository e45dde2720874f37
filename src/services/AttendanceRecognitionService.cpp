#include "services/AttendanceRecognitionService.hpp"
#include "extract/DescriptorExtractor.hpp"
#include "gallery/GalleryCache.hpp"
#include "liveness/LivenessGate.hpp"
#include "log/SystemLogger.hpp"
#include "match/FaceMatcher.hpp"
#include "services/FaceDataRepository.hpp"
#include <QtCore/QDebug>

const char* AttendanceRecognitionService::statusName(RecognitionOutcome::Status s)
{
	switch (s) {
		case RecognitionOutcome::Status::Recognized:    return "recognized";
		case RecognitionOutcome::Status::NoFace:        return "no_face";
		case RecognitionOutcome::Status::NoEmployees:   return "no_employees";
		case RecognitionOutcome::Status::NotRecognized: return "not_recognized";
		case RecognitionOutcome::Status::Error:         return "error";
	}
	return "error";
}

RecognitionOutcome AttendanceRecognitionService::recognize(const QString& payload)
{
	RecognitionOutcome out;

	const ExtractResult ex = extractor_.extractFromPayload(payload);
	if (ex.status == ExtractResult::Status::Failed) {
		qWarning() << "[AttendanceRecognitionService] extraction failed:" << ex.error;
		SystemLogger::error("MATCH", QStringLiteral("Descriptor extraction failed"), ex.error);
		out.status  = RecognitionOutcome::Status::Error;
		out.message = QStringLiteral("Error processing face recognition. Please try again.");
		return out;
	}
	if (!ex.ok()) {
		qInfo() << "[AttendanceRecognitionService] no face in query image";
		out.status  = RecognitionOutcome::Status::NoFace;
		out.message = QStringLiteral("No face detected. Please ensure your face is clearly visible in the camera frame and well-lit.");
		return out;
	}

	const std::vector<GalleryEntry> gallery = gallery_.getAll();
	const MatchResult m = matcher_.match(*ex.descriptor, gallery);

	switch (m.status) {
		case MatchStatus::EmptyGallery:
			qCritical() << "[AttendanceRecognitionService] gallery is empty";
			SystemLogger::error("MATCH", QStringLiteral("No registered employees found"));
			out.status  = RecognitionOutcome::Status::NoEmployees;
			out.message = QStringLiteral("No registered employees found. Please contact administrator.");
			return out;

		case MatchStatus::NoMatch:
			out.status     = RecognitionOutcome::Status::NotRecognized;
			out.distance   = m.minDistance;
			out.similarity = m.similarity;
			out.message    = QString("Face not recognized. Your face doesn't match any registered employee. "
									 "Please ensure you are registered in the system. (Similarity: %1%)")
									 .arg(m.similarity, 0, 'f', 1);
			qInfo() << "[AttendanceRecognitionService] no match, min distance=" << m.minDistance;
			SystemLogger::warn("MATCH", QStringLiteral("Face not recognized"),
							   QString("min_distance=%1").arg(m.minDistance, 0, 'f', 4));
			return out;

		case MatchStatus::Matched:
			break;
	}

	out.status     = RecognitionOutcome::Status::Recognized;
	out.employeeId = m.employeeId;
	out.distance   = m.distance;
	out.similarity = m.similarity;
	out.message    = QString("Employee %1 recognized (Similarity: %2%)")
						 .arg(m.employeeId).arg(m.similarity, 0, 'f', 1);

	qInfo() << "[AttendanceRecognitionService] matched employee" << m.employeeId
			<< "distance=" << m.distance << "tolerance=" << m.tolerance;
	SystemLogger::info("MATCH", QString("Employee %1 recognized").arg(m.employeeId),
					   QString("distance=%1 tolerance=%2").arg(m.distance, 0, 'f', 4).arg(m.tolerance, 0, 'f', 2));
	return out;
}

EnrollOutcome AttendanceRecognitionService::enroll(int employeeId, const QString& payload)
{
	EnrollOutcome out;
	if (employeeId < 0) {
		out.message = QStringLiteral("Invalid employee id");
		return out;
	}

	const ExtractResult ex = extractor_.extractFromPayload(payload);
	if (ex.status == ExtractResult::Status::Failed) {
		out.message = QString("Face encoding failed: %1").arg(ex.error);
		SystemLogger::error("ENROLL", out.message, QString("employee=%1").arg(employeeId));
		return out;
	}
	if (!ex.ok()) {
		out.message = QStringLiteral("No face detected in image");
		SystemLogger::info("ENROLL", out.message, QString("employee=%1").arg(employeeId));
		return out;
	}

	if (!repo_.saveDescriptor(employeeId, *ex.descriptor)) {
		out.message = QStringLiteral("Failed to save face data");
		qCritical() << "[AttendanceRecognitionService] save failed for employee" << employeeId;
		SystemLogger::error("ENROLL", out.message, QString("employee=%1").arg(employeeId));
		return out;
	}
	gallery_.invalidate();

	out.ok      = true;
	out.message = QString("Face registered for employee %1").arg(employeeId);
	SystemLogger::info("ENROLL", out.message);
	return out;
}

bool AttendanceRecognitionService::removeEmployee(int employeeId)
{
	if (!repo_.removeDescriptor(employeeId)) {
		SystemLogger::error("ENROLL", QStringLiteral("Failed to remove face data"),
							QString("employee=%1").arg(employeeId));
		return false;
	}
	gallery_.invalidate();
	SystemLogger::info("ENROLL", QString("Face data removed for employee %1").arg(employeeId));
	return true;
}

LivenessResult AttendanceRecognitionService::verifyLiveness(const QStringList& payloads) const
{
	return liveness_.checkPayloads(payloads);
}
