#include "sync_options.hpp"

#include "../common/option_parsing.hpp"
#include "../common/package_identity.hpp"
#include "../config/list_file.hpp"

#include <optional>
#include <string_view>
#include <system_error>

namespace linkpack::sync
{
    SyncCommandLineResult parseSyncCommandLine(int argc, char** argv)
    {
        SyncCommandLineResult result;

        for (int index = 1; index < argc; ++index)
        {
            std::string_view argument{argv[index]};

            if (argument == "--help")
            {
                result.showHelp = true;
                return result;
            }

            if (argument == "--version")
            {
                result.showVersion = true;
                return result;
            }

            if (argument == "--strict")
            {
                result.options.strict = true;
                continue;
            }

            if (argument == "--verbose")
            {
                result.options.verbose = true;
                continue;
            }

            if (auto workspaceValue = parseOptionWithValue(argument, "--workspace", index, argc, argv, result.errorMessage))
            {
                result.options.workspaceRoot = std::filesystem::path{*workspaceValue};
                continue;
            }

            if (auto depsValue = parseOptionWithValue(argument, "--deps", index, argc, argv, result.errorMessage))
            {
                result.options.dependencyListPath = std::filesystem::path{*depsValue};
                continue;
            }

            if (auto repositoryValue = parseOptionWithValue(argument, "--repository", index, argc, argv, result.errorMessage))
            {
                result.options.repositoryRoot = std::filesystem::path{*repositoryValue};
                continue;
            }

            if (auto configurationValue = parseOptionWithValue(argument, "--configuration", index, argc, argv, result.errorMessage))
            {
                std::string errorMessage;
                if (!validateIdentityComponent(*configurationValue, "configuration", false, errorMessage))
                {
                    result.hasError = true;
                    result.errorMessage = errorMessage;
                    return result;
                }

                result.options.configuration = std::string{*configurationValue};
                continue;
            }

            if (!result.errorMessage.empty())
            {
                result.hasError = true;
                return result;
            }

            result.hasError = true;
            if (!argument.empty() && argument.front() == '-')
            {
                result.errorMessage = "unknown option '" + std::string{argument} + "'.";
            }
            else
            {
                result.errorMessage = "unexpected argument '" + std::string{argument} + "'.";
            }
            return result;
        }

        if (result.options.workspaceRoot.empty())
        {
            std::error_code currentError;
            result.options.workspaceRoot = std::filesystem::current_path(currentError);
            if (currentError)
            {
                result.hasError = true;
                result.errorMessage = "failed to determine the current directory: " + currentError.message();
                return result;
            }
        }

        if (result.options.dependencyListPath.empty())
        {
            result.options.dependencyListPath = result.options.workspaceRoot / config::defaultDependencyListName;
        }

        return result;
    }
} // namespace linkpack::sync
