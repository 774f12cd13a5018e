#include <cstring>
#include <sstream>

#include <plog/Log.h>

#include "bounded_writer.hpp"
#include "nostd/data/hex.hpp"
#include "nostd/errors.hpp"

using namespace std;
using namespace nostd;
using namespace nostd::internal;

BoundedWriter::BoundedWriter(char* buffer, size_t capacity, const char* context)
    : _buffer(buffer), _capacity(capacity), _size(0), _context(context)
{
};

void BoundedWriter::put(char c)
{
    this->_reserve(1);
    this->_buffer[this->_size++] = c;
};

void BoundedWriter::write(string_view text)
{
    this->_reserve(text.size());
    memcpy(this->_buffer + this->_size, text.data(), text.size());
    this->_size += text.size();
};

void BoundedWriter::writeQuoted(string_view text)
{
    this->put('"');

    // NIP-01 defines exactly these escapes; every other byte is written verbatim.
    for (char c : text)
    {
        switch (c)
        {
        case '\n':
            this->write("\\n");
            break;
        case '"':
            this->write("\\\"");
            break;
        case '\\':
            this->write("\\\\");
            break;
        case '\r':
            this->write("\\r");
            break;
        case '\t':
            this->write("\\t");
            break;
        case '\b':
            this->write("\\b");
            break;
        case '\f':
            this->write("\\f");
            break;
        default:
            this->put(c);
            break;
        }
    }

    this->put('"');
};

void BoundedWriter::writeDecimal(uint64_t value)
{
    // 2^64 - 1 has 20 decimal digits.
    char digits[20];
    size_t count = 0;
    do
    {
        digits[count++] = static_cast<char>('0' + value % 10);
        value /= 10;
    } while (value > 0);

    this->_reserve(count);
    while (count > 0)
    {
        this->_buffer[this->_size++] = digits[--count];
    }
};

void BoundedWriter::writeQuotedHex(const uint8_t* bytes, size_t length)
{
    this->_reserve(2 * length + 2);
    this->_buffer[this->_size++] = '"';
    data::encodeHex(bytes, length, this->_buffer + this->_size);
    this->_size += 2 * length;
    this->_buffer[this->_size++] = '"';
};

void BoundedWriter::_reserve(size_t count) const
{
    if (count > this->_capacity - this->_size)
    {
        ostringstream oss;
        oss << this->_context << ": The output buffer of " << this->_capacity
            << " bytes is too small.";
        PLOG_ERROR << oss.str();
        throw BufferTooSmall(oss.str(), this->_size + count);
    }
};
