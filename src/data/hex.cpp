#include <stdexcept>

#include "nostd/data/hex.hpp"

using namespace std;

namespace
{
constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hexValue(char c)
{
    if (c >= '0' && c <= '9')
    {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f')
    {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F')
    {
        return c - 'A' + 10;
    }
    return -1;
}
} // namespace

namespace nostd
{
namespace data
{
void encodeHex(const uint8_t* input, size_t length, char* output)
{
    for (size_t i = 0; i < length; i++)
    {
        output[2 * i] = HEX_DIGITS[input[i] >> 4];
        output[2 * i + 1] = HEX_DIGITS[input[i] & 0x0f];
    }
};

void decodeHex(string_view input, uint8_t* output, size_t length)
{
    if (input.size() != 2 * length)
    {
        throw invalid_argument("decodeHex: The hex string has the wrong length.");
    }

    for (size_t i = 0; i < length; i++)
    {
        int high = hexValue(input[2 * i]);
        int low = hexValue(input[2 * i + 1]);
        if (high < 0 || low < 0)
        {
            throw invalid_argument("decodeHex: The string contains a character that is not a hex digit.");
        }

        output[i] = static_cast<uint8_t>((high << 4) | low);
    }
};
} // namespace data
} // namespace nostd
