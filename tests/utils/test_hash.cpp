#include <catch2/catch.hpp>

#include "walkforge/utils/hash.hpp"

#include <string>
#include <vector>

using walkforge::utils::Sha256;
using walkforge::utils::sha256Hex;

namespace {

std::string hexOf(const std::string &text) {
	return sha256Hex(std::vector<std::uint8_t>(text.begin(), text.end()));
}

} // namespace

TEST_CASE("sha256Hex matches published digests", "[utils][hash]") {
	REQUIRE(hexOf("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
	REQUIRE(hexOf("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
	REQUIRE(hexOf("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
	        "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
	REQUIRE(hexOf("The quick brown fox jumps over the lazy dog") ==
	        "d7a8fbb307d7809469ca9abcb0082e4f8d5651e46d3cdb762d02d0bf37c9e592");
}

TEST_CASE("Sha256 handles long input fed in pieces", "[utils][hash]") {
	const std::string chunk(1000, 'a');
	Sha256 hasher;
	for (int i = 0; i < 1000; ++i) {
		hasher.update(chunk);
	}
	REQUIRE(Sha256::toHex(hasher.finalize()) == "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("Sha256 digest does not depend on how input is split", "[utils][hash]") {
	std::vector<std::uint8_t> payload(517);
	for (std::size_t i = 0; i < payload.size(); ++i) {
		payload[i] = static_cast<std::uint8_t>((i * 31U + 7U) & 0xFFU);
	}

	Sha256 split;
	split.update(payload.data(), 63);
	split.update(payload.data() + 63, 1);
	split.update(payload.data() + 64, payload.size() - 64);

	REQUIRE(Sha256::toHex(split.finalize()) == sha256Hex(payload));
	REQUIRE(sha256Hex(payload).size() == 64);
}
