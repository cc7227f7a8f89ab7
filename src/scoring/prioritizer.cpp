#include "datasentry/scoring/prioritizer.hpp"

#include <algorithm>

namespace datasentry::scoring {

bool precedes(const core::Anomaly &lhs, const core::Anomaly &rhs) {
	if (lhs.severity() != rhs.severity()) {
		return lhs.severity() > rhs.severity();
	}
	if (lhs.score() != rhs.score()) {
		return lhs.score() > rhs.score();
	}
	return lhs.timeWindow().start > rhs.timeWindow().start;
}

void prioritize(std::vector<core::Anomaly> &anomalies) {
	std::stable_sort(anomalies.begin(), anomalies.end(), precedes);
}

std::vector<core::Anomaly> prioritized(std::vector<core::Anomaly> anomalies) {
	prioritize(anomalies);
	return anomalies;
}

} // namespace datasentry::scoring
