#pragma once

#include "../common/diagnostic.hpp"
#include "../common/tool_runner.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace linkpack::build
{
    using TemplateVariables = std::map<std::string, std::string, std::less<>>;

    struct BuildRequest
    {
        std::string packageName;
        std::string configuration{"Release"};
        std::vector<std::string> architectures;
        std::filesystem::path projectRoot;
        std::filesystem::path buildRoot;
        std::string minimumVersion;
        std::filesystem::path builderExecutable{"make"};
        // Empty selects defaultBuilderArguments().
        std::vector<std::string> builderArguments;
    };

    struct ArchitectureBuild
    {
        std::string architecture;
        ToolInvocation invocation;
        std::filesystem::path outputDirectory;
        std::filesystem::path expectedBinary;
    };

    struct BuildPlanResult
    {
        std::vector<ArchitectureBuild> builds;
        bool hasError{false};
        std::string errorMessage;
    };

    struct BuildRunResult
    {
        std::vector<Diagnostic> diagnostics;
        bool hasError{false};
        int terminatingSignal{0};
    };

    std::vector<std::string> defaultBuilderArguments();

    // <build root>/<configuration>-<architecture>
    std::filesystem::path architectureOutputDirectory(const std::filesystem::path& buildRoot,
        std::string_view configuration,
        std::string_view architecture);

    // <build root>/<configuration>-<architecture>/lib<name>.a
    std::filesystem::path expectedArchitectureBinary(const std::filesystem::path& buildRoot,
        std::string_view configuration,
        std::string_view architecture,
        std::string_view packageName);

    // Replaces "{variable}" placeholders; an unknown or unterminated placeholder is an error.
    bool expandTemplate(std::string_view text,
        const TemplateVariables& variables,
        std::string& expanded,
        std::string& errorMessage);

    BuildPlanResult planArchitectureBuilds(const BuildRequest& request);

    BuildRunResult runArchitectureBuild(const ArchitectureBuild& build, ToolRunner& runner);
} // namespace linkpack::build
