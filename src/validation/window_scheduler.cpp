#include "walkforge/validation/window_scheduler.hpp"
#include "walkforge/core/errors.hpp"
#include "walkforge/utils/logging.hpp"

#include <limits>

namespace walkforge::validation {

std::string toString(WindowMode mode) {
	switch (mode) {
	case WindowMode::ROLLING:
		return "rolling";
	case WindowMode::EXPANDING:
		return "expanding";
	}
	return "unknown";
}

WindowMode windowModeFromString(const std::string &name) {
	if (name == "rolling") {
		return WindowMode::ROLLING;
	}
	if (name == "expanding") {
		return WindowMode::EXPANDING;
	}
	throw core::ConfigError("Unknown window mode '" + name + "'. Expected 'rolling' or 'expanding'.");
}

void SchedulerConfig::validate() const {
	if (train_size <= 0) {
		throw core::ConfigError("train_size must be positive, got " + std::to_string(train_size) + ".");
	}
	if (val_size <= 0) {
		throw core::ConfigError("val_size must be positive, got " + std::to_string(val_size) + ".");
	}
	if (step_size <= 0) {
		throw core::ConfigError("step_size must be positive, got " + std::to_string(step_size) + ".");
	}
	if (embargo < 0) {
		throw core::ConfigError("embargo must be non-negative, got " + std::to_string(embargo) + ".");
	}
}

WindowScheduler::WindowScheduler(std::size_t index_length, const SchedulerConfig &config)
    : index_length_(index_length), config_(config) {
	config_.validate();
	const auto minimum = static_cast<std::size_t>(config_.train_size) + static_cast<std::size_t>(config_.embargo) +
	                     static_cast<std::size_t>(config_.val_size);
	if (index_length_ < minimum) {
		WALKFORGE_INFO("Time index of {} points is shorter than train+embargo+val ({}); no windows scheduled.",
		               index_length_, minimum);
	}
}

std::optional<Window> WindowScheduler::next() {
	if (exhausted_) {
		return std::nullopt;
	}

	const auto train_size = static_cast<std::size_t>(config_.train_size);
	const auto val_size = static_cast<std::size_t>(config_.val_size);
	const auto step = static_cast<std::size_t>(config_.step_size);
	const auto embargo = static_cast<std::size_t>(config_.embargo);

	// Stop before offset arithmetic could wrap around.
	if (next_index_ > (std::numeric_limits<std::size_t>::max() - train_size) / step) {
		exhausted_ = true;
		return std::nullopt;
	}
	const std::size_t offset = next_index_ * step;

	Window window;
	window.index = next_index_;
	if (config_.mode == WindowMode::EXPANDING) {
		window.train_start = 0;
		window.train_end = train_size + offset;
	} else {
		window.train_start = offset;
		window.train_end = offset + train_size;
	}

	if (window.train_end > index_length_ || index_length_ - window.train_end < embargo + val_size) {
		exhausted_ = true;
		return std::nullopt;
	}
	window.val_start = window.train_end + embargo;
	window.val_end = window.val_start + val_size;

	++next_index_;
	return window;
}

WindowScheduler::Iterator::Iterator(WindowScheduler *owner) : owner_(owner) {
	current_ = owner_->next();
}

WindowScheduler::Iterator &WindowScheduler::Iterator::operator++() {
	current_ = owner_ ? owner_->next() : std::nullopt;
	return *this;
}

WindowScheduler::Iterator WindowScheduler::begin() {
	return Iterator(this);
}

} // namespace walkforge::validation
