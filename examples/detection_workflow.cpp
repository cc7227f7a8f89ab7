#include "datasentry/engine/detection_engine.hpp"
#include "datasentry/utils/logging.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

using namespace datasentry;

namespace {

const core::TimePoint kOrigin = core::TimePoint{} + std::chrono::hours(24 * 365 * 50);

core::TimeSeries synthesizeRevenue(std::size_t days) {
	std::mt19937 rng(11);
	std::normal_distribution<double> noise(0.0, 2.0);

	std::vector<core::TimePoint> timestamps;
	std::vector<double> values;
	for (std::size_t i = 0; i < days; ++i) {
		const double weekly = 12.0 * std::sin(2.0 * M_PI * static_cast<double>(i % 7) / 7.0);
		double value = 250.0 + 0.2 * static_cast<double>(i) + weekly + noise(rng);
		if (i == 45) {
			value += 120.0; // billing double-run
		}
		if (i >= 80 && i < 84) {
			value -= 90.0; // payment outage
		}
		timestamps.push_back(kOrigin + std::chrono::hours(24 * i));
		values.push_back(value);
	}
	return core::TimeSeries(timestamps, values);
}

core::TextData synthesizeFeedback(std::size_t weeks) {
	const std::vector<std::string> routine{
	    "Service was timely and the staff were helpful",
	    "Invoice arrived on schedule, payment portal works",
	    "Question about the annual report, answered quickly",
	};
	std::vector<core::TextBucket> buckets;
	for (std::size_t w = 0; w < weeks; ++w) {
		core::TextBucket bucket;
		bucket.start = kOrigin + std::chrono::hours(24 * 7 * w);
		bucket.end = bucket.start + std::chrono::hours(24 * 7 - 1);
		const bool surge = w == weeks - 1;
		for (std::size_t d = 0; d < 12; ++d) {
			const auto ts = bucket.start + std::chrono::hours(10 * d);
			const std::string id = "w" + std::to_string(w) + "-" + std::to_string(d);
			if (surge && d % 2 == 0) {
				bucket.documents.emplace_back(id, "Payment outage again, refund delayed and the portal failed", ts,
				                              std::string("complaint"), std::vector<std::string>{"outage"});
			} else {
				bucket.documents.emplace_back(id, routine[d % routine.size()], ts, std::string("inquiry"));
			}
		}
		buckets.push_back(std::move(bucket));
	}
	return core::TextData(std::move(buckets));
}

} // namespace

int main() {
	utils::Logging::init(spdlog::level::info);

	engine::DetectionRequest request;
	request.numeric_columns.push_back({"daily_revenue", synthesizeRevenue(120)});
	request.text_columns.push_back({"customer_feedback", synthesizeFeedback(6)});

	core::AnomalyDetectionParameters params;
	params.minimum_anomaly_duration = 1;

	engine::EngineOptions options;
	options.time_budget = std::chrono::seconds(10);

	auto report = engine::DetectionEngine(options).run(request, params);

	std::cout << "Columns\n";
	for (const auto &column : report.columns()) {
		std::cout << "  " << std::setw(18) << std::left << column.name << engine::toString(column.status) << '\n';
		for (const auto &outcome : column.outcomes) {
			std::cout << "    " << std::setw(18) << core::toString(outcome.method) << detectors::toString(outcome.status);
			if (outcome.reason) {
				std::cout << " (" << detectors::toString(*outcome.reason) << ")";
			}
			std::cout << '\n';
		}
	}

	std::cout << "\nRanked anomalies (" << report.elapsed().count() << " ms)\n";
	for (const auto &anomaly : report.releaseAnomalies()) {
		std::cout << "  " << std::setw(7) << std::left << core::toString(anomaly.severity()) << std::setw(15)
		          << core::toString(anomaly.type()) << std::setw(18) << core::toString(anomaly.method())
		          << std::fixed << std::setprecision(2) << anomaly.score();
		if (anomaly.magnitude()) {
			std::cout << "  magnitude " << *anomaly.magnitude()
			          << (anomaly.magnitudeKind() == core::MagnitudeKind::Percent ? "%" : " pp");
		}
		for (const auto &keyword : anomaly.affectedRegion().keywords) {
			std::cout << "  #" << keyword;
		}
		for (const auto &category : anomaly.affectedRegion().categories) {
			std::cout << "  [" << category << "]";
		}
		std::cout << "  " << anomaly.id() << '\n';
	}
	return 0;
}
