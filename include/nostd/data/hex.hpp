#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string_view>

#include <etl/string.h>

namespace nostd
{
namespace data
{
/**
 * @brief Writes the lowercase hex encoding of `length` bytes to `output`.
 * @remark `output` must have room for `2 * length` characters.  No terminator is written.
 */
void encodeHex(const uint8_t* input, std::size_t length, char* output);

/**
 * @brief Decodes `2 * length` hex characters into `length` bytes.
 * @throws `std::invalid_argument` if `input` is not exactly `2 * length` hex digits.
 * @remark Both upper and lower case digits are accepted.
 */
void decodeHex(std::string_view input, uint8_t* output, std::size_t length);

/**
 * @brief Encodes a fixed-size byte array as lowercase hex.
 */
template <std::size_t N>
etl::string<2 * N> toHex(const std::array<uint8_t, N>& bytes)
{
    std::array<char, 2 * N> chars;
    encodeHex(bytes.data(), N, chars.data());
    return etl::string<2 * N>(chars.data(), chars.size());
}

/**
 * @brief Decodes a hex string into a fixed-size byte array.
 * @throws `std::invalid_argument` if the string is not exactly `2 * N` hex digits.
 */
template <std::size_t N>
std::array<uint8_t, N> fromHex(std::string_view hex)
{
    std::array<uint8_t, N> bytes;
    decodeHex(hex, bytes.data(), N);
    return bytes;
}
} // namespace data
} // namespace nostd
