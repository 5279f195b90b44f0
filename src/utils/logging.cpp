#include "hydro-recharge/utils/logging.hpp"

#ifndef HYDRO_NO_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>

namespace hydrorecharge::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("hydro-recharge");
		if (!logger_) {
			logger_ = spdlog::stderr_color_mt("hydro-recharge");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Warnings by default; engine runs are chatty at info level.
		init(spdlog::level::warn);
	}
	return logger_;
}

} // namespace hydrorecharge::utils

#endif // HYDRO_NO_LOGGING
