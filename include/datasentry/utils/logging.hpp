#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace datasentry::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every component of the engine logs through the same logger, which the
 * embedding application configures once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace datasentry::utils

#define DATASENTRY_TRACE(...)    datasentry::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define DATASENTRY_DEBUG(...)    datasentry::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define DATASENTRY_INFO(...)     datasentry::utils::Logging::getLogger()->info(__VA_ARGS__)
#define DATASENTRY_WARN(...)     datasentry::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define DATASENTRY_ERROR(...)    datasentry::utils::Logging::getLogger()->error(__VA_ARGS__)
#define DATASENTRY_CRITICAL(...) datasentry::utils::Logging::getLogger()->critical(__VA_ARGS__)
