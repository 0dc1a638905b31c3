#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace linkpack
{
    // FNV-1a, 64 bit. Stable across platforms and runs.
    std::uint64_t checksum64(std::string_view data);

    std::string toHex(std::uint64_t value, std::size_t digits = 16);
}
