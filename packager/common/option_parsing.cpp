#include "option_parsing.hpp"

namespace linkpack
{
    std::optional<std::string_view> parseOptionWithValue(std::string_view argument,
        std::string_view name,
        int& index,
        int argc,
        char** argv,
        std::string& errorMessage)
    {
        if (argument == name)
        {
            if (index + 1 >= argc)
            {
                errorMessage = std::string{name} + " requires a value.";
                return std::nullopt;
            }
            return std::string_view{argv[++index]};
        }

        if (argument.rfind(name, 0) == 0 && argument.size() > name.size() && argument[name.size()] == '=')
        {
            return argument.substr(name.size() + 1);
        }

        return std::nullopt;
    }
} // namespace linkpack
