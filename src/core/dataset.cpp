#include "walkforge/core/dataset.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

namespace walkforge::core {

Dataset::Dataset(std::vector<TimePoint> times, std::vector<std::string> entities, std::vector<std::string> column_names,
                 std::vector<std::vector<double>> columns, std::string schema_version)
    : times_(std::move(times)), entities_(std::move(entities)), column_names_(std::move(column_names)),
      columns_(std::move(columns)), schema_version_(std::move(schema_version)) {
	validate();
	for (std::size_t i = 0; i < column_names_.size(); ++i) {
		column_index_.emplace(column_names_[i], i);
	}
	buildTimeIndex();
}

void Dataset::validate() const {
	if (entities_.size() != times_.size()) {
		throw std::invalid_argument("Entity column must have one value per row.");
	}
	if (column_names_.size() != columns_.size()) {
		throw std::invalid_argument("Column names must match the number of value columns.");
	}
	std::unordered_set<std::string> seen_names;
	for (std::size_t i = 0; i < columns_.size(); ++i) {
		if (column_names_[i].empty()) {
			throw std::invalid_argument("Column names must not be empty.");
		}
		if (!seen_names.insert(column_names_[i]).second) {
			throw std::invalid_argument("Duplicate column name '" + column_names_[i] + "'.");
		}
		if (columns_[i].size() != times_.size()) {
			throw std::invalid_argument("Column '" + column_names_[i] + "' length must match the number of rows.");
		}
	}

	std::unordered_set<std::string> entities_at_time;
	for (std::size_t i = 0; i < times_.size(); ++i) {
		if (i > 0 && times_[i] < times_[i - 1]) {
			throw std::invalid_argument("Dataset rows must be sorted by time.");
		}
		if (i > 0 && times_[i] != times_[i - 1]) {
			entities_at_time.clear();
		}
		if (!entities_at_time.insert(entities_[i]).second) {
			throw std::invalid_argument("Entity '" + entities_[i] + "' appears more than once at the same time point.");
		}
	}
}

void Dataset::buildTimeIndex() {
	time_index_.clear();
	row_offsets_.clear();
	for (std::size_t i = 0; i < times_.size(); ++i) {
		if (i == 0 || times_[i] != times_[i - 1]) {
			time_index_.push_back(times_[i]);
			row_offsets_.push_back(i);
		}
	}
	row_offsets_.push_back(times_.size());
}

const std::vector<double> &Dataset::column(const std::string &name) const {
	const auto it = column_index_.find(name);
	if (it == column_index_.end()) {
		throw std::out_of_range("Column '" + name + "' not found.");
	}
	return columns_[it->second];
}

std::vector<std::string> Dataset::featureColumns(const std::string &prefix) const {
	std::vector<std::string> names;
	for (const auto &name : column_names_) {
		if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
			names.push_back(name);
		}
	}
	std::sort(names.begin(), names.end());
	return names;
}

std::pair<std::size_t, std::size_t> Dataset::rowRange(std::size_t begin, std::size_t end) const {
	if (begin > end) {
		throw std::invalid_argument("Time-index range start must not exceed its end.");
	}
	if (end > time_index_.size()) {
		throw std::out_of_range("Time-index range exceeds the dataset's time index.");
	}
	return {row_offsets_[begin], row_offsets_[end]};
}

Dataset Dataset::sliceByTimeIndex(std::size_t begin, std::size_t end) const {
	const auto range = rowRange(begin, end);
	return sliceRows(range.first, range.second);
}

Dataset Dataset::sliceRows(std::size_t begin, std::size_t end) const {
	if (begin > end) {
		throw std::invalid_argument("Slice start index must not exceed end index.");
	}
	if (end > size()) {
		throw std::out_of_range("Slice end index exceeds the number of rows.");
	}
	const auto first = static_cast<std::ptrdiff_t>(begin);
	const auto last = static_cast<std::ptrdiff_t>(end);

	std::vector<std::vector<double>> sliced_columns;
	sliced_columns.reserve(columns_.size());
	for (const auto &column : columns_) {
		sliced_columns.emplace_back(column.begin() + first, column.begin() + last);
	}
	return Dataset(std::vector<TimePoint>(times_.begin() + first, times_.begin() + last),
	               std::vector<std::string>(entities_.begin() + first, entities_.begin() + last), column_names_,
	               std::move(sliced_columns), schema_version_);
}

} // namespace walkforge::core
