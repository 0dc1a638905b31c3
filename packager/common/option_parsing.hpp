#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace linkpack
{
    // Matches "--name=value" and "--name value". The separate form consumes the next argument;
    // when there is none, errorMessage is set and nullopt returned.
    std::optional<std::string_view> parseOptionWithValue(std::string_view argument,
        std::string_view name,
        int& index,
        int argc,
        char** argv,
        std::string& errorMessage);
} // namespace linkpack
