#include "backtime/utils/logging.hpp"

#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace backtime::utils {

namespace {
std::mutex logger_mutex;
} // namespace

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(logger_mutex);
	if (!logger_) {
		logger_ = spdlog::get("backtime");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("backtime");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// Fold workers may log concurrently on first use.
	static std::once_flag created;
	std::call_once(created, [] {
		if (!logger_) {
			init();
		}
	});
	return logger_;
}

} // namespace backtime::utils
