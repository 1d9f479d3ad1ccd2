#include <politeia/crypto_lib/blake256.hpp>

#include <algorithm>
#include <cstring>

namespace
{
uint32_t constexpr iv[8] = {
	0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a, 0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19
};

uint32_t constexpr constants[16] = {
	0x243f6a88, 0x85a308d3, 0x13198a2e, 0x03707344, 0xa4093822, 0x299f31d0, 0x082efa98, 0xec4e6c89,
	0x452821e6, 0x38d01377, 0xbe5466cf, 0x34e90c6c, 0xc0ac29b7, 0xc97c50dd, 0x3f84d5b5, 0xb5470917
};

uint8_t constexpr sigma[10][16] = {
	{ 0, 1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15 },
	{ 14, 10, 4, 8, 9, 15, 13, 6, 1, 12, 0, 2, 11, 7, 5, 3 },
	{ 11, 8, 12, 0, 5, 2, 15, 13, 10, 14, 3, 6, 7, 1, 9, 4 },
	{ 7, 9, 3, 1, 13, 12, 11, 14, 2, 6, 5, 10, 4, 0, 15, 8 },
	{ 9, 0, 5, 7, 2, 4, 10, 15, 14, 1, 11, 12, 6, 8, 3, 13 },
	{ 2, 12, 6, 10, 0, 11, 8, 3, 4, 13, 7, 5, 15, 14, 1, 9 },
	{ 12, 5, 1, 15, 14, 13, 4, 10, 0, 7, 6, 3, 9, 2, 8, 11 },
	{ 13, 11, 7, 14, 12, 1, 3, 9, 5, 0, 15, 4, 8, 6, 2, 10 },
	{ 6, 15, 14, 9, 11, 3, 0, 8, 12, 2, 13, 7, 1, 4, 10, 5 },
	{ 10, 2, 8, 4, 7, 6, 1, 5, 15, 11, 9, 14, 3, 12, 13, 0 }
};

size_t constexpr rounds = 14;

inline uint32_t rotr (uint32_t value_a, unsigned bits_a)
{
	return (value_a >> bits_a) | (value_a << (32 - bits_a));
}

inline uint32_t read_be32 (uint8_t const * data_a)
{
	return (static_cast<uint32_t> (data_a[0]) << 24) | (static_cast<uint32_t> (data_a[1]) << 16) | (static_cast<uint32_t> (data_a[2]) << 8) | static_cast<uint32_t> (data_a[3]);
}

inline void write_be32 (uint8_t * data_a, uint32_t value_a)
{
	data_a[0] = static_cast<uint8_t> (value_a >> 24);
	data_a[1] = static_cast<uint8_t> (value_a >> 16);
	data_a[2] = static_cast<uint8_t> (value_a >> 8);
	data_a[3] = static_cast<uint8_t> (value_a);
}
}

politeia::blake256::blake256 ()
{
	std::memcpy (h.data (), iv, sizeof (iv));
}

void politeia::blake256::compress (uint8_t const * block_a, uint64_t counter_a)
{
	uint32_t m[16];
	for (auto i (0); i < 16; ++i)
	{
		m[i] = read_be32 (block_a + 4 * i);
	}
	uint32_t v[16];
	for (auto i (0); i < 8; ++i)
	{
		v[i] = h[i];
	}
	v[8] = constants[0];
	v[9] = constants[1];
	v[10] = constants[2];
	v[11] = constants[3];
	v[12] = static_cast<uint32_t> (counter_a) ^ constants[4];
	v[13] = static_cast<uint32_t> (counter_a) ^ constants[5];
	v[14] = static_cast<uint32_t> (counter_a >> 32) ^ constants[6];
	v[15] = static_cast<uint32_t> (counter_a >> 32) ^ constants[7];
	auto g = [&v, &m](uint8_t const * s, size_t a, size_t b, size_t c, size_t d, size_t e) {
		v[a] += v[b] + (m[s[e]] ^ constants[s[e + 1]]);
		v[d] = rotr (v[d] ^ v[a], 16);
		v[c] += v[d];
		v[b] = rotr (v[b] ^ v[c], 12);
		v[a] += v[b] + (m[s[e + 1]] ^ constants[s[e]]);
		v[d] = rotr (v[d] ^ v[a], 8);
		v[c] += v[d];
		v[b] = rotr (v[b] ^ v[c], 7);
	};
	for (size_t round (0); round < rounds; ++round)
	{
		auto s (sigma[round % 10]);
		g (s, 0, 4, 8, 12, 0);
		g (s, 1, 5, 9, 13, 2);
		g (s, 2, 6, 10, 14, 4);
		g (s, 3, 7, 11, 15, 6);
		g (s, 0, 5, 10, 15, 8);
		g (s, 1, 6, 11, 12, 10);
		g (s, 2, 7, 8, 13, 12);
		g (s, 3, 4, 9, 14, 14);
	}
	for (auto i (0); i < 8; ++i)
	{
		h[i] ^= v[i] ^ v[i + 8];
	}
}

void politeia::blake256::update (void const * data_a, size_t size_a)
{
	auto data (static_cast<uint8_t const *> (data_a));
	while (size_a > 0)
	{
		auto count (std::min (size_a, buffer.size () - buffer_size));
		std::memcpy (buffer.data () + buffer_size, data, count);
		buffer_size += count;
		total_bytes += count;
		data += count;
		size_a -= count;
		if (buffer_size == buffer.size ())
		{
			compress (buffer.data (), total_bytes * 8);
			buffer_size = 0;
		}
	}
}

politeia::blake256::digest politeia::blake256::final ()
{
	auto bits (total_bytes * 8);
	uint8_t length[8];
	write_be32 (length, static_cast<uint32_t> (bits >> 32));
	write_be32 (length + 4, static_cast<uint32_t> (bits));
	if (buffer_size == 55)
	{
		buffer[55] = 0x81;
		std::memcpy (buffer.data () + 56, length, 8);
		compress (buffer.data (), bits);
	}
	else if (buffer_size < 55)
	{
		auto counter (buffer_size == 0 ? 0 : bits);
		buffer[buffer_size] = 0x80;
		std::memset (buffer.data () + buffer_size + 1, 0, 55 - buffer_size - 1);
		buffer[55] = 0x01;
		std::memcpy (buffer.data () + 56, length, 8);
		compress (buffer.data (), counter);
	}
	else
	{
		buffer[buffer_size] = 0x80;
		std::memset (buffer.data () + buffer_size + 1, 0, buffer.size () - buffer_size - 1);
		compress (buffer.data (), bits);
		std::memset (buffer.data (), 0, 55);
		buffer[55] = 0x01;
		std::memcpy (buffer.data () + 56, length, 8);
		compress (buffer.data (), 0);
	}
	buffer_size = 0;
	digest result;
	for (auto i (0); i < 8; ++i)
	{
		write_be32 (result.data () + 4 * i, h[i]);
	}
	return result;
}

politeia::blake256::digest politeia::blake256::hash (void const * data_a, size_t size_a)
{
	politeia::blake256 state;
	state.update (data_a, size_a);
	return state.final ();
}
