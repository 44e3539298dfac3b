#include "walkforge/utils/byte_buffer.hpp"
#include "walkforge/core/errors.hpp"

#include <cstring>

namespace walkforge::utils {

void ByteWriter::writeU8(std::uint8_t value) {
	bytes_.push_back(value);
}

void ByteWriter::writeU32(std::uint32_t value) {
	for (unsigned shift = 0; shift < 32; shift += 8) {
		bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
	}
}

void ByteWriter::writeU64(std::uint64_t value) {
	for (unsigned shift = 0; shift < 64; shift += 8) {
		bytes_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
	}
}

void ByteWriter::writeI64(std::int64_t value) {
	writeU64(static_cast<std::uint64_t>(value));
}

void ByteWriter::writeDouble(double value) {
	std::uint64_t bits = 0;
	static_assert(sizeof(bits) == sizeof(value), "double must be 64-bit");
	std::memcpy(&bits, &value, sizeof(bits));
	writeU64(bits);
}

void ByteWriter::writeString(const std::string &value) {
	writeU64(static_cast<std::uint64_t>(value.size()));
	bytes_.insert(bytes_.end(), value.begin(), value.end());
}

void ByteWriter::writeDoubles(const std::vector<double> &values) {
	writeU64(static_cast<std::uint64_t>(values.size()));
	for (double v : values) {
		writeDouble(v);
	}
}

void ByteWriter::writeStrings(const std::vector<std::string> &values) {
	writeU64(static_cast<std::uint64_t>(values.size()));
	for (const auto &v : values) {
		writeString(v);
	}
}

void ByteReader::require(std::size_t count) const {
	if (count > remaining()) {
		throw core::SerializationError("Payload truncated: needed " + std::to_string(count) + " bytes, " +
		                               std::to_string(remaining()) + " available.");
	}
}

std::uint8_t ByteReader::readU8() {
	require(1);
	return bytes_[offset_++];
}

std::uint32_t ByteReader::readU32() {
	require(4);
	std::uint32_t value = 0;
	for (unsigned shift = 0; shift < 32; shift += 8) {
		value |= static_cast<std::uint32_t>(bytes_[offset_++]) << shift;
	}
	return value;
}

std::uint64_t ByteReader::readU64() {
	require(8);
	std::uint64_t value = 0;
	for (unsigned shift = 0; shift < 64; shift += 8) {
		value |= static_cast<std::uint64_t>(bytes_[offset_++]) << shift;
	}
	return value;
}

std::int64_t ByteReader::readI64() {
	return static_cast<std::int64_t>(readU64());
}

double ByteReader::readDouble() {
	const std::uint64_t bits = readU64();
	double value = 0.0;
	std::memcpy(&value, &bits, sizeof(value));
	return value;
}

std::string ByteReader::readString() {
	const auto length = readU64();
	require(static_cast<std::size_t>(length));
	std::string value(bytes_.begin() + static_cast<std::ptrdiff_t>(offset_),
	                  bytes_.begin() + static_cast<std::ptrdiff_t>(offset_ + length));
	offset_ += static_cast<std::size_t>(length);
	return value;
}

std::vector<double> ByteReader::readDoubles() {
	const auto count = readU64();
	// Every element needs eight bytes; reject absurd counts before allocating.
	if (count > remaining() / 8) {
		require(remaining() + 1);
	}
	std::vector<double> values;
	values.reserve(static_cast<std::size_t>(count));
	for (std::uint64_t i = 0; i < count; ++i) {
		values.push_back(readDouble());
	}
	return values;
}

std::vector<std::string> ByteReader::readStrings() {
	const auto count = readU64();
	if (count > remaining() / 8) {
		require(remaining() + 1);
	}
	std::vector<std::string> values;
	values.reserve(static_cast<std::size_t>(count));
	for (std::uint64_t i = 0; i < count; ++i) {
		values.push_back(readString());
	}
	return values;
}

void ByteReader::expectEnd() const {
	if (!atEnd()) {
		throw core::SerializationError("Payload has " + std::to_string(remaining()) + " trailing bytes.");
	}
}

} // namespace walkforge::utils
