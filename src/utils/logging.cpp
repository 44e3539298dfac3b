#include "walkforge/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>

namespace walkforge::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

namespace {

std::mutex &loggerMutex() {
	static std::mutex mutex;
	return mutex;
}

} // namespace

void Logging::init(spdlog::level::level_enum level) {
	std::lock_guard<std::mutex> lock(loggerMutex());
	if (!logger_) {
		logger_ = spdlog::get("walkforge");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("walkforge");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	// Worker threads may log first; the logger is created exactly once and never replaced.
	static std::once_flag created;
	std::call_once(created, [] {
		if (!logger_) {
			init();
		}
	});
	return logger_;
}

} // namespace walkforge::utils
