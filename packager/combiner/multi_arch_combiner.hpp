#pragma once

#include "../common/diagnostic.hpp"
#include "../common/tool_runner.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace linkpack::combiner
{
    struct ArchitectureSlice
    {
        std::string architecture;
        std::filesystem::path binaryPath;
    };

    struct CombineRequest
    {
        std::vector<ArchitectureSlice> slices;
        std::filesystem::path outputPath;
        std::filesystem::path combinerExecutable{"lipo"};
    };

    struct CombinePlanResult
    {
        ToolInvocation invocation;
        std::vector<std::string> architectures;
        std::vector<Diagnostic> diagnostics;
        bool hasError{false};
    };

    struct CombineResult
    {
        std::filesystem::path universalBinary;
        std::vector<std::string> architectures;
        std::vector<Diagnostic> diagnostics;
        bool hasError{false};
    };

    // Checks that every slice exists and orders the inputs by architecture.
    CombinePlanResult planCombine(const CombineRequest& request);

    CombineResult combine(const CombineRequest& request, ToolRunner& runner);
} // namespace linkpack::combiner
