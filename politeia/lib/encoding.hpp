#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace politeia
{
using byte_vector = std::vector<uint8_t>;

/** Lower case hex of \p bytes_a */
std::string to_hex (byte_vector const & bytes_a);
std::string to_hex (uint8_t const * data_a, size_t size_a);
/** @return true if \p text_a is not an even length string of hex digits */
bool from_hex (std::string const & text_a, byte_vector & bytes_a);
bool is_hex (std::string const & text_a);

/** Standard (RFC 4648) padded base64 */
std::string base64_encode (byte_vector const & bytes_a);
/** @return true if \p text_a is not canonical padded base64 */
bool base64_decode (std::string const & text_a, byte_vector & bytes_a);

/** Base58 with the bitcoin alphabet, leading zero bytes map to '1' */
std::string base58_encode (byte_vector const & bytes_a);
bool base58_decode (std::string const & text_a, byte_vector & bytes_a);

/** Appends a compact-size length prefix followed by \p text_a */
void write_varstring (byte_vector & stream_a, std::string const & text_a);
}
