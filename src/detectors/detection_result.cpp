#include "datasentry/detectors/detection_result.hpp"

namespace datasentry::detectors {

std::string toString(MethodStatus status) {
	switch (status) {
	case MethodStatus::Ran:
		return "ran";
	case MethodStatus::Fallback:
		return "fallback";
	case MethodStatus::Skipped:
		return "skipped";
	}
	return "unknown";
}

std::string toString(SkipReason reason) {
	switch (reason) {
	case SkipReason::InsufficientData:
		return "insufficient_data";
	case SkipReason::DegenerateInput:
		return "degenerate_input";
	}
	return "unknown";
}

} // namespace datasentry::detectors
