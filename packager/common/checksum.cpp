#include "checksum.hpp"

namespace linkpack
{
    std::uint64_t checksum64(std::string_view data)
    {
        constexpr std::uint64_t offset = 1469598103934665603ull;
        constexpr std::uint64_t prime = 1099511628211ull;

        std::uint64_t hash = offset;
        for (unsigned char c : data)
        {
            hash ^= static_cast<std::uint64_t>(c);
            hash *= prime;
        }
        return hash;
    }

    std::string toHex(std::uint64_t value, std::size_t digits)
    {
        static constexpr char hexDigits[] = "0123456789abcdef";

        if (digits > 16)
        {
            digits = 16;
        }

        std::string result(digits, '0');
        for (std::size_t index = 0; index < digits; ++index)
        {
            result[digits - 1 - index] = hexDigits[value & 0xF];
            value >>= 4;
        }
        return result;
    }
} // namespace linkpack
