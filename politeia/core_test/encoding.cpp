#include <politeia/crypto_lib/blake256.hpp>
#include <politeia/lib/encoding.hpp>

#include <gtest/gtest.h>

namespace
{
std::string blake256_hex (std::string const & data_a)
{
	auto digest (politeia::blake256::hash (data_a.data (), data_a.size ()));
	return politeia::to_hex (digest.data (), digest.size ());
}
}

TEST (blake256, empty)
{
	ASSERT_EQ ("716f6e863f744b9ac22c97ec7b76ea5f5908bc5b2f67c61510bfc4751384ea7a", blake256_hex (""));
}

TEST (blake256, one_zero_byte)
{
	ASSERT_EQ ("0ce8d4ef4dd7cd8d62dfded9d4edb0a774ae6a41929a74da23109e8f11139c87", blake256_hex (std::string (1, '\0')));
}

TEST (blake256, two_blocks)
{
	ASSERT_EQ ("d419bad32d504fb7d44d460c42c5593fe544fa4c135dec31e21bd9abdcc22d41", blake256_hex (std::string (72, '\0')));
}

TEST (blake256, text)
{
	ASSERT_EQ ("7576698ee9cad30173080678e5965916adbb11cb5245d386bf1ffda1cb26c9d7", blake256_hex ("The quick brown fox jumps over the lazy dog"));
}

TEST (blake256, incremental)
{
	std::string text ("The quick brown fox jumps over the lazy dog");
	for (size_t split (0); split <= text.size (); ++split)
	{
		politeia::blake256 hash;
		hash.update (text.data (), split);
		hash.update (text.data () + split, text.size () - split);
		ASSERT_EQ (politeia::blake256::hash (text.data (), text.size ()), hash.final ());
	}
}

TEST (hex, decode)
{
	politeia::byte_vector bytes;
	ASSERT_FALSE (politeia::from_hex ("0aFF10", bytes));
	ASSERT_EQ ((politeia::byte_vector{ 0x0a, 0xff, 0x10 }), bytes);
	ASSERT_EQ ("0aff10", politeia::to_hex (bytes));
	ASSERT_TRUE (politeia::from_hex ("abc", bytes));
	ASSERT_TRUE (politeia::from_hex ("zz", bytes));
	ASSERT_FALSE (politeia::is_hex (""));
	ASSERT_FALSE (politeia::is_hex ("0g"));
	ASSERT_TRUE (politeia::is_hex ("deadbeef"));
}

TEST (base64, encode)
{
	std::string text ("foobar");
	ASSERT_EQ ("Zm9vYmFy", politeia::base64_encode (politeia::byte_vector (text.begin (), text.end ())));
	ASSERT_EQ ("Zm8=", politeia::base64_encode (politeia::byte_vector (text.begin (), text.begin () + 2)));
	ASSERT_EQ ("", politeia::base64_encode (politeia::byte_vector ()));
}

TEST (base64, decode)
{
	politeia::byte_vector bytes;
	ASSERT_FALSE (politeia::base64_decode ("Zm8=", bytes));
	ASSERT_EQ ((politeia::byte_vector{ 'f', 'o' }), bytes);
	ASSERT_TRUE (politeia::base64_decode ("Zm8", bytes));
	ASSERT_TRUE (politeia::base64_decode ("Zm9v!mFy", bytes));
}

TEST (base58, encode_decode)
{
	std::string text ("Hello World!");
	politeia::byte_vector bytes (text.begin (), text.end ());
	ASSERT_EQ ("2NEpo7TZRRrLZSi2U", politeia::base58_encode (bytes));
	politeia::byte_vector decoded;
	ASSERT_FALSE (politeia::base58_decode ("2NEpo7TZRRrLZSi2U", decoded));
	ASSERT_EQ (bytes, decoded);
}

TEST (base58, leading_zeros)
{
	politeia::byte_vector bytes{ 0, 0, 1 };
	auto text (politeia::base58_encode (bytes));
	ASSERT_EQ ("112", text);
	politeia::byte_vector decoded;
	ASSERT_FALSE (politeia::base58_decode (text, decoded));
	ASSERT_EQ (bytes, decoded);
}

TEST (base58, invalid_character)
{
	politeia::byte_vector decoded;
	ASSERT_TRUE (politeia::base58_decode ("0OIl", decoded));
}

TEST (varstring, prefix)
{
	politeia::byte_vector stream;
	politeia::write_varstring (stream, "abc");
	ASSERT_EQ ((politeia::byte_vector{ 3, 'a', 'b', 'c' }), stream);
	politeia::byte_vector long_stream;
	politeia::write_varstring (long_stream, std::string (300, 'x'));
	ASSERT_EQ (303, long_stream.size ());
	ASSERT_EQ (0xfd, long_stream[0]);
	ASSERT_EQ (0x2c, long_stream[1]);
	ASSERT_EQ (0x01, long_stream[2]);
}
