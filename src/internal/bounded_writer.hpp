#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace nostd
{
namespace internal
{
/**
 * @brief Appends text to a caller-owned buffer of fixed capacity.
 * @remark Every write checks the remaining capacity first and throws `BufferTooSmall` rather than
 * truncating.  The buffer is not terminated.
 */
class BoundedWriter
{
public:
    /**
     * @param context The name of the operation writing, used in error messages.
     */
    BoundedWriter(char* buffer, std::size_t capacity, const char* context);

    void put(char c);

    void write(std::string_view text);

    /**
     * @brief Writes a string wrapped in double quotes, applying the NIP-01 escapes.
     */
    void writeQuoted(std::string_view text);

    /**
     * @brief Writes an unsigned integer in decimal with no leading zeros.
     */
    void writeDecimal(uint64_t value);

    /**
     * @brief Writes bytes as lowercase hex wrapped in double quotes.
     */
    void writeQuotedHex(const uint8_t* bytes, std::size_t length);

    std::size_t size() const { return this->_size; }

private:
    char* _buffer;
    std::size_t _capacity;
    std::size_t _size;
    const char* _context;

    /**
     * @throws `BufferTooSmall` if fewer than `count` bytes remain.
     */
    void _reserve(std::size_t count) const;
};
} // namespace internal
} // namespace nostd
