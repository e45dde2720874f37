#include "match/FaceMatcher.hpp"

#include <QtCore/QDebug>
#include <cmath>
#include <limits>

float FaceMatcher::distance(const FaceDescriptor& a, const FaceDescriptor& b)
{
	double sum = 0.0;
	for (size_t i = 0; i < kDescriptorDim; ++i) {
		const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
		sum += d * d;
	}
	return static_cast<float>(std::sqrt(sum));
}

namespace {

// a 가 b 보다 앞서는가: 거리 작은 쪽, 같으면 employeeId 작은 쪽
inline bool better(float da, int ida, float db, int idb)
{
	if (da != db) return da < db;
	return ida < idb;
}

} // namespace

MatchResult FaceMatcher::match(const FaceDescriptor& query, const std::vector<GalleryEntry>& gallery) const
{
	MatchResult r;
	if (gallery.empty()) {
		qWarning() << "[FaceMatcher] gallery is empty";
		r.status = MatchStatus::EmptyGallery;
		return r;
	}

	const float inf = std::numeric_limits<float>::infinity();
	std::vector<float> dist(gallery.size(), inf);
	int bestIdx = -1;
	for (size_t i = 0; i < gallery.size(); ++i) {
		const float d = distance(query, gallery[i].descriptor);
		if (!std::isfinite(d)) {
			qWarning() << "[FaceMatcher] non-finite distance, employee=" << gallery[i].employeeId;
			continue;
		}
		dist[i] = d;
		if (bestIdx < 0 || better(d, gallery[i].employeeId, dist[bestIdx], gallery[bestIdx].employeeId))
			bestIdx = static_cast<int>(i);
	}

	if (bestIdx < 0) {
		qWarning() << "[FaceMatcher] no comparable gallery entry";
		r.status = MatchStatus::NoMatch;
		return r;
	}

	const float minDistance = dist[bestIdx];
	r.minDistance = minDistance;
	r.similarity  = (1.0f - minDistance) * 100.0f;

	// 허용치 안에 드는 항목 표시
	std::vector<char> flags(gallery.size(), 0);
	auto mark = [&](float tol) {
		int n = 0;
		for (size_t i = 0; i < dist.size(); ++i) {
			flags[i] = (dist[i] <= tol) ? 1 : 0;
			n += flags[i];
		}
		return n;
	};

	const auto& steps = p_.tolerances;
	float tol = steps.empty() ? 0.0f : steps.front();
	int hits = mark(tol);
	qDebug() << "[FaceMatcher] min distance" << minDistance << "tolerance" << tol << "hits" << hits;

	// 가장 가까운 후보가 다음 단계 안에 있을 때만 완화
	for (size_t s = 1; s < steps.size() && hits == 0; ++s) {
		if (minDistance <= steps[s]) {
			tol  = steps[s];
			hits = mark(tol);
			qDebug() << "[FaceMatcher] relaxed tolerance to" << tol << "hits" << hits;
		}
	}
	r.tolerance = tol;

	if (hits == 0) {
		qDebug() << "[FaceMatcher] no match, min distance" << minDistance
				 << "similarity" << r.similarity << "%";
		r.status = MatchStatus::NoMatch;
		return r;
	}

	int pick = -1;
	for (size_t i = 0; i < gallery.size(); ++i) {
		if (!flags[i]) continue;
		if (pick < 0 || better(dist[i], gallery[i].employeeId, dist[pick], gallery[pick].employeeId))
			pick = static_cast<int>(i);
	}
	if (hits > 1) {
		qDebug() << "[FaceMatcher] ambiguous:" << hits << "entries within" << tol
				 << "-> employee" << gallery[pick].employeeId;
	}

	r.status     = MatchStatus::Matched;
	r.employeeId = gallery[pick].employeeId;
	r.distance   = dist[pick];
	return r;
}
