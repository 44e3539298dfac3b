#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace walkforge::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * A single logger instance is shared by the scheduler, trainer, adapters and
 * registry. Call init() at startup to choose the level; getLogger() creates
 * the logger lazily at info level otherwise.
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

} // namespace walkforge::utils

// --- Logger Macros for convenient access ---
#define WALKFORGE_TRACE(...)    walkforge::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define WALKFORGE_DEBUG(...)    walkforge::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define WALKFORGE_INFO(...)     walkforge::utils::Logging::getLogger()->info(__VA_ARGS__)
#define WALKFORGE_WARN(...)     walkforge::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define WALKFORGE_ERROR(...)    walkforge::utils::Logging::getLogger()->error(__VA_ARGS__)
#define WALKFORGE_CRITICAL(...) walkforge::utils::Logging::getLogger()->critical(__VA_ARGS__)
