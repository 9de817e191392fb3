#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace backtime::utils {

/**
 * @class Logging
 * @brief Singleton access to the library-wide spdlog logger.
 *
 * Every component logs through the same "backtime" logger so the level can be
 * adjusted once at startup (or in tests) for the whole library.
 */
class Logging {
public:
	/**
	 * @brief Gets the shared logger, creating it with the default level on first use.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Creates the logger if needed and sets its level and flush level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace backtime::utils

#define BACKTIME_TRACE(...)    backtime::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define BACKTIME_DEBUG(...)    backtime::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define BACKTIME_INFO(...)     backtime::utils::Logging::getLogger()->info(__VA_ARGS__)
#define BACKTIME_WARN(...)     backtime::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define BACKTIME_ERROR(...)    backtime::utils::Logging::getLogger()->error(__VA_ARGS__)
#define BACKTIME_CRITICAL(...) backtime::utils::Logging::getLogger()->critical(__VA_ARGS__)
