#pragma once

#include <chrono>
#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace walkforge::core {

/**
 * @class Dataset
 * @brief Time-ordered tabular dataset consumed by the walk-forward engine.
 *
 * Rows carry a time point, an entity (ticker) and one value per numeric
 * column. Rows are sorted by time and several entities may share a time
 * point, so the dataset's time index is the sorted set of unique times.
 * Feature columns are discovered by name prefix; the target column is chosen
 * by the caller. The schema version tags the upstream column contract.
 */
class Dataset {
public:
	using TimePoint = std::chrono::system_clock::time_point;

	/**
	 * @brief Constructs a dataset from column-major values.
	 * @throws std::invalid_argument If column lengths disagree, names repeat,
	 *         times decrease, or an entity appears twice at one time point.
	 */
	Dataset(std::vector<TimePoint> times, std::vector<std::string> entities, std::vector<std::string> column_names,
	        std::vector<std::vector<double>> columns, std::string schema_version);

	std::size_t size() const {
		return times_.size();
	}

	bool isEmpty() const {
		return times_.empty();
	}

	const std::vector<TimePoint> &times() const {
		return times_;
	}

	const std::vector<std::string> &entities() const {
		return entities_;
	}

	const std::string &schemaVersion() const {
		return schema_version_;
	}

	const std::vector<std::string> &columnNames() const {
		return column_names_;
	}

	bool hasColumn(const std::string &name) const {
		return column_index_.find(name) != column_index_.end();
	}

	/// @throws std::out_of_range If the column does not exist.
	const std::vector<double> &column(const std::string &name) const;

	/// Sorted names of every column that starts with @p prefix.
	std::vector<std::string> featureColumns(const std::string &prefix) const;

	/// Sorted unique time points; positions in this vector are what windows index.
	const std::vector<TimePoint> &timeIndex() const {
		return time_index_;
	}

	/**
	 * @brief Row range covering time-index positions [begin, end).
	 * @return Half-open row offsets; empty when begin == end.
	 */
	std::pair<std::size_t, std::size_t> rowRange(std::size_t begin, std::size_t end) const;

	/// Copy of every row whose time lies in time-index positions [begin, end).
	Dataset sliceByTimeIndex(std::size_t begin, std::size_t end) const;

	/// Copy of rows [begin, end) by row offset.
	Dataset sliceRows(std::size_t begin, std::size_t end) const;

private:
	void validate() const;
	void buildTimeIndex();

	std::vector<TimePoint> times_;
	std::vector<std::string> entities_;
	std::vector<std::string> column_names_;
	std::vector<std::vector<double>> columns_;
	std::string schema_version_;

	std::unordered_map<std::string, std::size_t> column_index_;
	std::vector<TimePoint> time_index_;
	// row_offsets_[k] is the first row at time_index_[k]; the last entry is size().
	std::vector<std::size_t> row_offsets_;
};

} // namespace walkforge::core
