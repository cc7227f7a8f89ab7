#include "datasentry/utils/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace datasentry::utils {

namespace {

std::once_flag logger_created;

std::shared_ptr<spdlog::logger> createLogger(spdlog::level::level_enum level) {
	auto logger = spdlog::get("datasentry");
	if (!logger) {
		logger = spdlog::stdout_color_mt("datasentry");
	}
	logger->set_level(level);
	logger->flush_on(level);
	return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::call_once(logger_created, [level]() { logger_ = createLogger(level); });
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// Workers log concurrently; creation happens exactly once.
	std::call_once(logger_created, []() { logger_ = createLogger(spdlog::level::info); });
	return logger_;
}

} // namespace datasentry::utils
