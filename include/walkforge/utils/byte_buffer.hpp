#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace walkforge::utils {

/**
 * @class ByteWriter
 * @brief Appends fixed-width little-endian fields to a byte payload.
 *
 * Doubles are written as their IEEE-754 bit pattern, so identical model state
 * always produces identical bytes on every platform.
 */
class ByteWriter {
public:
	void writeU8(std::uint8_t value);
	void writeU32(std::uint32_t value);
	void writeU64(std::uint64_t value);
	void writeI64(std::int64_t value);
	void writeDouble(double value);
	void writeString(const std::string &value);
	void writeDoubles(const std::vector<double> &values);
	void writeStrings(const std::vector<std::string> &values);

	const std::vector<std::uint8_t> &bytes() const {
		return bytes_;
	}
	std::vector<std::uint8_t> release() {
		return std::move(bytes_);
	}

private:
	std::vector<std::uint8_t> bytes_;
};

/**
 * @class ByteReader
 * @brief Reads fields written by ByteWriter; throws SerializationError on truncation.
 */
class ByteReader {
public:
	explicit ByteReader(const std::vector<std::uint8_t> &bytes) : bytes_(bytes) {
	}

	std::uint8_t readU8();
	std::uint32_t readU32();
	std::uint64_t readU64();
	std::int64_t readI64();
	double readDouble();
	std::string readString();
	std::vector<double> readDoubles();
	std::vector<std::string> readStrings();

	bool atEnd() const {
		return offset_ == bytes_.size();
	}
	std::size_t remaining() const {
		return bytes_.size() - offset_;
	}

	/// Fails unless every byte was consumed.
	void expectEnd() const;

private:
	void require(std::size_t count) const;

	const std::vector<std::uint8_t> &bytes_;
	std::size_t offset_ = 0;
};

} // namespace walkforge::utils
