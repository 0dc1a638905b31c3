#include "command_line.hpp"

#include "../common/option_parsing.hpp"
#include "../common/package_identity.hpp"
#include "../config/list_file.hpp"

#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace linkpack::driver
{
    namespace
    {
        void fail(CommandLineParseResult& result, std::string message)
        {
            result.hasError = true;
            result.errorMessage = std::move(message);
        }

        bool makeAbsolute(std::filesystem::path& path, std::string& errorMessage)
        {
            if (path.empty() || path.is_absolute())
            {
                return true;
            }

            std::error_code absoluteError;
            auto absolute = std::filesystem::absolute(path, absoluteError);
            if (absoluteError)
            {
                errorMessage = "failed to resolve '" + path.string() + "': " + absoluteError.message();
                return false;
            }

            path = absolute.lexically_normal();
            return true;
        }
    } // namespace

    std::vector<std::string> defaultArchitectures()
    {
        return {"arm64", "x86_64"};
    }

    CommandLineParseResult parseCommandLine(int argc, char** argv)
    {
        CommandLineParseResult result;
        auto& options = result.options;

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

            if (argument == "--verbose")
            {
                options.verbose = true;
                continue;
            }

            if (argument == "--dry-run")
            {
                options.dryRun = true;
                continue;
            }

            if (auto projectValue = parseOptionWithValue(argument, "--project", index, argc, argv, result.errorMessage))
            {
                options.projectRoot = std::filesystem::path{*projectValue};
                continue;
            }

            if (auto nameValue = parseOptionWithValue(argument, "--name", index, argc, argv, result.errorMessage))
            {
                std::string errorMessage;
                if (!validateIdentityComponent(*nameValue, "package name", false, errorMessage))
                {
                    fail(result, errorMessage);
                    return result;
                }

                options.packageName = std::string{*nameValue};
                continue;
            }

            if (auto configurationValue = parseOptionWithValue(argument, "--configuration", index, argc, argv, result.errorMessage))
            {
                std::string errorMessage;
                if (!validateIdentityComponent(*configurationValue, "configuration", false, errorMessage))
                {
                    fail(result, errorMessage);
                    return result;
                }

                options.configuration = std::string{*configurationValue};
                continue;
            }

            if (auto versionValue = parseOptionWithValue(argument, "--version-tag", index, argc, argv, result.errorMessage))
            {
                std::string errorMessage;
                if (!validateIdentityComponent(*versionValue, "version tag", true, errorMessage))
                {
                    fail(result, errorMessage);
                    return result;
                }

                options.versionTag = std::string{*versionValue};
                continue;
            }

            if (auto embedValue = parseOptionWithValue(argument, "--embed", index, argc, argv, result.errorMessage))
            {
                if (auto mode = assembler::parseEmbedMode(*embedValue))
                {
                    options.embedMode = *mode;
                    continue;
                }

                fail(result, "unknown embed mode '" + std::string{*embedValue} + "' (expected binary, source or both).");
                return result;
            }

            if (auto minimumValue = parseOptionWithValue(argument, "--min-version", index, argc, argv, result.errorMessage))
            {
                options.minimumVersion = std::string{*minimumValue};
                continue;
            }

            if (auto archValue = parseOptionWithValue(argument, "--arch", index, argc, argv, result.errorMessage))
            {
                std::string errorMessage;
                if (!validateArchitectureName(*archValue, errorMessage))
                {
                    fail(result, errorMessage);
                    return result;
                }

                options.architectures.emplace_back(*archValue);
                continue;
            }

            if (auto headersValue = parseOptionWithValue(argument, "--headers", index, argc, argv, result.errorMessage))
            {
                options.headerListPath = std::filesystem::path{*headersValue};
                continue;
            }

            if (auto forceValue = parseOptionWithValue(argument, "--force-link", index, argc, argv, result.errorMessage))
            {
                options.forcedLinkListPath = std::filesystem::path{*forceValue};
                options.forcedLinkListExplicit = true;
                continue;
            }

            if (auto repositoryValue = parseOptionWithValue(argument, "--repository", index, argc, argv, result.errorMessage))
            {
                options.repositoryRoot = std::filesystem::path{*repositoryValue};
                continue;
            }

            if (auto buildRootValue = parseOptionWithValue(argument, "--build-root", index, argc, argv, result.errorMessage))
            {
                options.buildRoot = std::filesystem::path{*buildRootValue};
                continue;
            }

            if (auto stateValue = parseOptionWithValue(argument, "--state-dir", index, argc, argv, result.errorMessage))
            {
                options.stateDirectory = std::filesystem::path{*stateValue};
                continue;
            }

            if (auto builderValue = parseOptionWithValue(argument, "--builder-arg", index, argc, argv, result.errorMessage))
            {
                options.builderArguments.emplace_back(*builderValue);
                continue;
            }

            if (auto builderValue = parseOptionWithValue(argument, "--builder", index, argc, argv, result.errorMessage))
            {
                if (builderValue->empty())
                {
                    fail(result, "--builder requires an executable.");
                    return result;
                }

                options.builderExecutable = std::filesystem::path{*builderValue};
                continue;
            }

            if (auto combinerValue = parseOptionWithValue(argument, "--combiner", index, argc, argv, result.errorMessage))
            {
                if (combinerValue->empty())
                {
                    fail(result, "--combiner requires an executable.");
                    return result;
                }

                options.combinerExecutable = std::filesystem::path{*combinerValue};
                continue;
            }

            if (auto policyValue = parseOptionWithValue(argument, "--resource-policy", index, argc, argv, result.errorMessage))
            {
                if (auto policy = assembler::parseResourcePolicy(*policyValue))
                {
                    options.resourcePolicy = *policy;
                    continue;
                }

                fail(result, "unknown resource policy '" + std::string{*policyValue} + "' (expected warn or reject).");
                return result;
            }

            if (!result.errorMessage.empty())
            {
                result.hasError = true;
                return result;
            }

            if (!argument.empty() && argument.front() == '-')
            {
                fail(result, "unknown option '" + std::string{argument} + "'.");
            }
            else
            {
                fail(result, "unexpected argument '" + std::string{argument} + "'.");
            }
            return result;
        }

        std::string errorMessage;
        if (!applyConventionDefaults(options, errorMessage))
        {
            fail(result, errorMessage);
        }

        return result;
    }

    bool applyConventionDefaults(PackageOptions& options, std::string& errorMessage)
    {
        if (options.projectRoot.empty())
        {
            std::error_code currentError;
            options.projectRoot = std::filesystem::current_path(currentError);
            if (currentError)
            {
                errorMessage = "failed to determine the current directory: " + currentError.message();
                return false;
            }
        }

        if (!makeAbsolute(options.projectRoot, errorMessage))
        {
            return false;
        }

        if (options.packageName.empty())
        {
            auto projectName = options.projectRoot.filename();
            if (projectName.empty())
            {
                projectName = options.projectRoot.parent_path().filename();
            }

            options.packageName = projectName.string();
            if (!validateIdentityComponent(options.packageName, "package name", false, errorMessage))
            {
                errorMessage += " Use --name to choose one.";
                return false;
            }
        }

        if (options.architectures.empty())
        {
            options.architectures = defaultArchitectures();
        }

        if (options.headerListPath.empty())
        {
            options.headerListPath = options.projectRoot / config::defaultHeaderListName;
        }

        if (options.forcedLinkListPath.empty())
        {
            options.forcedLinkListPath = options.projectRoot / config::defaultForcedLinkListName;
        }

        if (options.buildRoot.empty())
        {
            options.buildRoot = options.projectRoot / "build" / "linkpack";
        }

        if (options.stateDirectory.empty())
        {
            options.stateDirectory = options.projectRoot / ".linkpack" / "snapshots";
        }

        return makeAbsolute(options.headerListPath, errorMessage) && makeAbsolute(options.forcedLinkListPath, errorMessage)
            && makeAbsolute(options.repositoryRoot, errorMessage) && makeAbsolute(options.buildRoot, errorMessage)
            && makeAbsolute(options.stateDirectory, errorMessage);
    }
} // namespace linkpack::driver
