#pragma once

#ifndef HYDRO_NO_LOGGING
#include <spdlog/spdlog.h>
#include <memory>

namespace hydrorecharge::utils {

/**
 * @class Logging
 * @brief Shared access point to the spdlog logger used by the recharge engine.
 *
 * The logger is the only process-wide object in the library. It carries no
 * computation state, so engine runs stay independent of each other.
 */
class Logging {
public:
	/**
	 * @brief Gets the engine logger, creating it on first use.
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

} // namespace hydrorecharge::utils

#define HYDRO_TRACE(...)    hydrorecharge::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define HYDRO_DEBUG(...)    hydrorecharge::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define HYDRO_INFO(...)     hydrorecharge::utils::Logging::getLogger()->info(__VA_ARGS__)
#define HYDRO_WARN(...)     hydrorecharge::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define HYDRO_ERROR(...)    hydrorecharge::utils::Logging::getLogger()->error(__VA_ARGS__)
#define HYDRO_CRITICAL(...) hydrorecharge::utils::Logging::getLogger()->critical(__VA_ARGS__)

#else
// No-op logging when spdlog is compiled out

namespace hydrorecharge::utils {

class Logging {
public:
	static void init() {}
};

} // namespace hydrorecharge::utils

#define HYDRO_TRACE(...)    do {} while(0)
#define HYDRO_DEBUG(...)    do {} while(0)
#define HYDRO_INFO(...)     do {} while(0)
#define HYDRO_WARN(...)     do {} while(0)
#define HYDRO_ERROR(...)    do {} while(0)
#define HYDRO_CRITICAL(...) do {} while(0)

#endif // HYDRO_NO_LOGGING
