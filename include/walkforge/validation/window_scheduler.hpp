#pragma once

#include <cstddef>
#include <iterator>
#include <optional>
#include <string>

namespace walkforge::validation {

/**
 * @brief How the training range moves between windows.
 */
enum class WindowMode {
	ROLLING,   // Fixed-size training range that slides by step_size
	EXPANDING  // Training range anchored at 0 that grows by step_size
};

std::string toString(WindowMode mode);

/// @throws core::ConfigError For anything other than "rolling" or "expanding".
WindowMode windowModeFromString(const std::string &name);

/**
 * @brief Configuration for walk-forward window generation.
 *
 * Sizes are counts of time-index positions, not wall-clock durations.
 */
struct SchedulerConfig {
	int train_size = 252;   // Training range length (initial length when expanding)
	int val_size = 5;       // Validation range length
	int step_size = 5;      // Shift between consecutive windows
	int embargo = 0;        // Minimum gap between train_end and val_start
	WindowMode mode = WindowMode::ROLLING;

	/// @throws core::ConfigError On non-positive sizes or a negative embargo.
	void validate() const;

	/// Consecutive validation ranges share rows when the step is shorter than the range.
	bool hasOverlappingValidation() const {
		return step_size < val_size;
	}
};

/**
 * @brief One train/validation split, as half-open ranges over the time index.
 */
struct Window {
	std::size_t index = 0;
	std::size_t train_start = 0;
	std::size_t train_end = 0;
	std::size_t val_start = 0;
	std::size_t val_end = 0;

	std::size_t trainSize() const {
		return train_end - train_start;
	}
	std::size_t valSize() const {
		return val_end - val_start;
	}

	bool operator==(const Window &other) const {
		return index == other.index && train_start == other.train_start && train_end == other.train_end &&
		       val_start == other.val_start && val_end == other.val_end;
	}
	bool operator!=(const Window &other) const {
		return !(*this == other);
	}
};

/**
 * @class WindowScheduler
 * @brief Lazily produces walk-forward windows over a time index.
 *
 * Windows are generated one at a time in increasing index order and only
 * when they fit entirely inside the index; a short index yields no windows.
 * The sequence is single-pass: once next() returns nullopt the scheduler stays
 * exhausted.
 *
 * @code
 * WindowScheduler scheduler(dataset.timeIndex().size(), config);
 * for (const auto &window : scheduler) { ... }
 * @endcode
 */
class WindowScheduler {
public:
	class Iterator {
	public:
		using iterator_category = std::input_iterator_tag;
		using value_type = Window;
		using difference_type = std::ptrdiff_t;
		using pointer = const Window *;
		using reference = const Window &;

		Iterator() = default;

		reference operator*() const {
			return *current_;
		}
		pointer operator->() const {
			return &*current_;
		}
		Iterator &operator++();

		bool operator==(const Iterator &other) const {
			return current_.has_value() == other.current_.has_value();
		}
		bool operator!=(const Iterator &other) const {
			return !(*this == other);
		}

	private:
		friend class WindowScheduler;
		explicit Iterator(WindowScheduler *owner);

		WindowScheduler *owner_ = nullptr;
		std::optional<Window> current_;
	};

	/**
	 * @param index_length Number of points in the dataset's time index.
	 * @param config Window geometry; validated here.
	 * @throws core::ConfigError If the configuration is invalid.
	 */
	WindowScheduler(std::size_t index_length, const SchedulerConfig &config);

	/// Produces the next window, or nullopt once the index is exhausted.
	std::optional<Window> next();

	bool exhausted() const {
		return exhausted_;
	}

	const SchedulerConfig &config() const {
		return config_;
	}

	std::size_t indexLength() const {
		return index_length_;
	}

	/// Single-pass range; begin() consumes the first window.
	Iterator begin();
	Iterator end() {
		return Iterator();
	}

private:
	std::size_t index_length_;
	SchedulerConfig config_;
	std::size_t next_index_ = 0;
	bool exhausted_ = false;
};

} // namespace walkforge::validation
