#pragma once

#include <cstddef>
#include <string_view>

#include "nostd/data/data.hpp"

namespace nostd
{
namespace cryptography
{
/**
 * @brief Computes the SHA-256 digest of a byte sequence.
 */
data::Digest sha256(const void* data, std::size_t length);

inline data::Digest sha256(std::string_view data)
{
    return sha256(data.data(), data.size());
}
} // namespace cryptography
} // namespace nostd
