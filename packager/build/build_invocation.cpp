#include "build_invocation.hpp"

#include "../common/package_identity.hpp"

#include <system_error>
#include <utility>

namespace linkpack::build
{
    std::vector<std::string> defaultBuilderArguments()
    {
        return {
            "-C",
            "{project}",
            "ARCH={arch}",
            "CONFIGURATION={configuration}",
            "BUILD_DIR={build_dir}",
            "MIN_VERSION={min_version}",
        };
    }

    std::filesystem::path architectureOutputDirectory(const std::filesystem::path& buildRoot,
        std::string_view configuration,
        std::string_view architecture)
    {
        std::string directoryName{configuration};
        directoryName += '-';
        directoryName += architecture;
        return buildRoot / directoryName;
    }

    std::filesystem::path expectedArchitectureBinary(const std::filesystem::path& buildRoot,
        std::string_view configuration,
        std::string_view architecture,
        std::string_view packageName)
    {
        return architectureOutputDirectory(buildRoot, configuration, architecture)
            / ("lib" + std::string{packageName} + ".a");
    }

    bool expandTemplate(std::string_view text,
        const TemplateVariables& variables,
        std::string& expanded,
        std::string& errorMessage)
    {
        expanded.clear();
        expanded.reserve(text.size());

        std::size_t position = 0;
        while (position < text.size())
        {
            const auto open = text.find('{', position);
            if (open == std::string_view::npos)
            {
                expanded.append(text.substr(position));
                break;
            }

            expanded.append(text.substr(position, open - position));

            const auto close = text.find('}', open + 1);
            if (close == std::string_view::npos)
            {
                errorMessage = "unterminated placeholder in '" + std::string{text} + "'.";
                return false;
            }

            const auto name = text.substr(open + 1, close - open - 1);
            auto variable = variables.find(name);
            if (variable == variables.end())
            {
                errorMessage = "unknown placeholder '{" + std::string{name} + "}' in '" + std::string{text} + "'.";
                return false;
            }

            expanded.append(variable->second);
            position = close + 1;
        }

        return true;
    }

    BuildPlanResult planArchitectureBuilds(const BuildRequest& request)
    {
        BuildPlanResult result;

        const auto architectures = normalizeArchitectures(request.architectures);
        if (architectures.empty())
        {
            result.hasError = true;
            result.errorMessage = "at least one target architecture is required.";
            return result;
        }

        const auto& argumentTemplates
            = request.builderArguments.empty() ? defaultBuilderArguments() : request.builderArguments;

        for (const auto& architecture : architectures)
        {
            if (!validateArchitectureName(architecture, result.errorMessage))
            {
                result.hasError = true;
                return result;
            }

            ArchitectureBuild build;
            build.architecture = architecture;
            build.outputDirectory = architectureOutputDirectory(request.buildRoot, request.configuration, architecture);
            build.expectedBinary
                = expectedArchitectureBinary(request.buildRoot, request.configuration, architecture, request.packageName);
            build.invocation.executable = request.builderExecutable;

            TemplateVariables variables{
                {"arch", architecture},
                {"configuration", request.configuration},
                {"project", request.projectRoot.string()},
                {"build_dir", build.outputDirectory.string()},
                {"min_version", request.minimumVersion},
                {"name", request.packageName},
            };

            for (const auto& argumentTemplate : argumentTemplates)
            {
                std::string argument;
                if (!expandTemplate(argumentTemplate, variables, argument, result.errorMessage))
                {
                    result.hasError = true;
                    return result;
                }
                build.invocation.arguments.emplace_back(std::move(argument));
            }

            result.builds.emplace_back(std::move(build));
        }

        return result;
    }

    BuildRunResult runArchitectureBuild(const ArchitectureBuild& build, ToolRunner& runner)
    {
        BuildRunResult result;

        std::error_code createError;
        std::filesystem::create_directories(build.outputDirectory, createError);
        if (createError)
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E3002",
                "failed to create build directory '" + build.outputDirectory.string() + "': " + createError.message()));
            return result;
        }

        auto run = runner.run(build.invocation);
        if (!run.launched)
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E3003",
                "build for architecture '" + build.architecture + "' could not start: " + run.errorMessage));
            return result;
        }

        if (run.terminatingSignal != 0)
        {
            result.hasError = true;
            result.terminatingSignal = run.terminatingSignal;
            result.diagnostics.emplace_back(makeError("LPK-E3001",
                "build for architecture '" + build.architecture + "' was terminated by signal "
                    + std::to_string(run.terminatingSignal) + "."));
            return result;
        }

        if (run.exitCode != 0)
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E3001",
                "build for architecture '" + build.architecture + "' failed with exit code "
                    + std::to_string(run.exitCode) + "."));
        }

        return result;
    }
} // namespace linkpack::build
