#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace politeia
{
/** BLAKE-256 (14 rounds), the hash Decred uses for addresses, checksums and signed messages */
class blake256 final
{
public:
	static size_t constexpr digest_size = 32;
	using digest = std::array<uint8_t, digest_size>;

	blake256 ();
	void update (void const * data_a, size_t size_a);
	digest final ();

	static digest hash (void const * data_a, size_t size_a);

private:
	void compress (uint8_t const * block_a, uint64_t counter_a);
	std::array<uint32_t, 8> h;
	std::array<uint8_t, 64> buffer;
	size_t buffer_size{ 0 };
	uint64_t total_bytes{ 0 };
};
}
