#include <politeia/lib/encoding.hpp>

#include <boost/algorithm/hex.hpp>

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <iterator>

namespace
{
char const * base58_alphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

std::array<int8_t, 256> base58_reverse ()
{
	std::array<int8_t, 256> result;
	result.fill (-1);
	for (int8_t i (0); i < 58; ++i)
	{
		result[static_cast<uint8_t> (base58_alphabet[i])] = i;
	}
	return result;
}

bool is_base64_char (char ch_a)
{
	return (ch_a >= 'A' && ch_a <= 'Z') || (ch_a >= 'a' && ch_a <= 'z') || (ch_a >= '0' && ch_a <= '9') || ch_a == '+' || ch_a == '/';
}
}

std::string politeia::to_hex (byte_vector const & bytes_a)
{
	return to_hex (bytes_a.data (), bytes_a.size ());
}

std::string politeia::to_hex (uint8_t const * data_a, size_t size_a)
{
	std::string result;
	result.reserve (size_a * 2);
	boost::algorithm::hex_lower (data_a, data_a + size_a, std::back_inserter (result));
	return result;
}

bool politeia::is_hex (std::string const & text_a)
{
	return !text_a.empty () && text_a.size () % 2 == 0 && std::all_of (text_a.begin (), text_a.end (), [](char ch) {
		return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
	});
}

bool politeia::from_hex (std::string const & text_a, byte_vector & bytes_a)
{
	auto error (text_a.size () % 2 != 0);
	if (!error)
	{
		byte_vector result;
		result.reserve (text_a.size () / 2);
		try
		{
			boost::algorithm::unhex (text_a.begin (), text_a.end (), std::back_inserter (result));
			bytes_a = std::move (result);
		}
		catch (boost::algorithm::hex_decode_error const &)
		{
			error = true;
		}
	}
	return error;
}

std::string politeia::base64_encode (byte_vector const & bytes_a)
{
	std::string result (4 * ((bytes_a.size () + 2) / 3) + 1, '\0');
	auto size (EVP_EncodeBlock (reinterpret_cast<unsigned char *> (&result[0]), bytes_a.data (), static_cast<int> (bytes_a.size ())));
	result.resize (size);
	return result;
}

bool politeia::base64_decode (std::string const & text_a, byte_vector & bytes_a)
{
	auto error (text_a.size () % 4 != 0);
	size_t padding (0);
	if (!error && !text_a.empty ())
	{
		padding = text_a[text_a.size () - 1] == '=' ? (text_a[text_a.size () - 2] == '=' ? 2 : 1) : 0;
		error = !std::all_of (text_a.begin (), text_a.end () - padding, is_base64_char);
	}
	if (!error)
	{
		byte_vector result (3 * text_a.size () / 4);
		auto size (EVP_DecodeBlock (result.data (), reinterpret_cast<unsigned char const *> (text_a.data ()), static_cast<int> (text_a.size ())));
		error = size < 0;
		if (!error)
		{
			result.resize (static_cast<size_t> (size) - padding);
			bytes_a = std::move (result);
		}
	}
	return error;
}

std::string politeia::base58_encode (byte_vector const & bytes_a)
{
	auto zeroes (std::find_if (bytes_a.begin (), bytes_a.end (), [](uint8_t byte) { return byte != 0; }) - bytes_a.begin ());
	// log(256) / log(58), rounded up
	byte_vector digits ((bytes_a.size () - zeroes) * 138 / 100 + 1, 0);
	size_t length (0);
	for (auto i (bytes_a.begin () + zeroes); i != bytes_a.end (); ++i)
	{
		int carry (*i);
		size_t j (0);
		for (auto k (digits.rbegin ()); (carry != 0 || j < length) && k != digits.rend (); ++k, ++j)
		{
			carry += 256 * (*k);
			*k = static_cast<uint8_t> (carry % 58);
			carry /= 58;
		}
		length = j;
	}
	std::string result (zeroes, '1');
	for (auto i (digits.begin () + (digits.size () - length)); i != digits.end (); ++i)
	{
		result.push_back (base58_alphabet[*i]);
	}
	return result;
}

bool politeia::base58_decode (std::string const & text_a, byte_vector & bytes_a)
{
	static auto const reverse (base58_reverse ());
	auto error (text_a.empty ());
	if (!error)
	{
		auto zeroes (std::find_if (text_a.begin (), text_a.end (), [](char ch) { return ch != '1'; }) - text_a.begin ());
		// log(58) / log(256), rounded up
		byte_vector result ((text_a.size () - zeroes) * 733 / 1000 + 1, 0);
		size_t length (0);
		for (auto i (text_a.begin () + zeroes); !error && i != text_a.end (); ++i)
		{
			int carry (reverse[static_cast<uint8_t> (*i)]);
			error = carry < 0;
			size_t j (0);
			for (auto k (result.rbegin ()); !error && (carry != 0 || j < length) && k != result.rend (); ++k, ++j)
			{
				carry += 58 * (*k);
				*k = static_cast<uint8_t> (carry % 256);
				carry /= 256;
			}
			length = j;
		}
		if (!error)
		{
			byte_vector decoded (zeroes, 0);
			decoded.insert (decoded.end (), result.begin () + (result.size () - length), result.end ());
			bytes_a = std::move (decoded);
		}
	}
	return error;
}

void politeia::write_varstring (byte_vector & stream_a, std::string const & text_a)
{
	uint64_t size (text_a.size ());
	auto write_le = [&stream_a](uint64_t value_a, size_t bytes_a) {
		for (size_t i (0); i < bytes_a; ++i)
		{
			stream_a.push_back (static_cast<uint8_t> (value_a >> (8 * i)));
		}
	};
	if (size < 0xfd)
	{
		write_le (size, 1);
	}
	else if (size <= 0xffff)
	{
		stream_a.push_back (0xfd);
		write_le (size, 2);
	}
	else if (size <= 0xffffffff)
	{
		stream_a.push_back (0xfe);
		write_le (size, 4);
	}
	else
	{
		stream_a.push_back (0xff);
		write_le (size, 8);
	}
	stream_a.insert (stream_a.end (), text_a.begin (), text_a.end ());
}
