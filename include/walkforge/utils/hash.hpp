#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace walkforge::utils {

/**
 * @class Sha256
 * @brief Incremental SHA-256 (FIPS 180-4) used for artifact content hashes.
 */
class Sha256 {
public:
	using Digest = std::array<std::uint8_t, 32>;

	Sha256();

	void update(const std::uint8_t *data, std::size_t length);
	void update(const std::vector<std::uint8_t> &data) {
		update(data.data(), data.size());
	}
	void update(const std::string &data) {
		update(reinterpret_cast<const std::uint8_t *>(data.data()), data.size());
	}

	/// Completes the hash. The object must not be updated afterwards.
	Digest finalize();

	static std::string toHex(const Digest &digest);

private:
	void processBlock(const std::uint8_t *block);

	std::array<std::uint32_t, 8> state_;
	std::array<std::uint8_t, 64> buffer_{};
	std::size_t buffer_size_ = 0;
	std::uint64_t total_bytes_ = 0;
	bool finalized_ = false;
};

/// Lower-case hex SHA-256 of a byte payload.
std::string sha256Hex(const std::vector<std::uint8_t> &data);

} // namespace walkforge::utils
