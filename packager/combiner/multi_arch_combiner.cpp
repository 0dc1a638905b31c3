#include "multi_arch_combiner.hpp"

#include "../common/file_io.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

namespace linkpack::combiner
{
    CombinePlanResult planCombine(const CombineRequest& request)
    {
        CombinePlanResult result;

        if (request.slices.empty())
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E3100", "no architecture binaries to combine."));
            return result;
        }

        if (request.outputPath.empty())
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E3100", "universal binary output path is empty."));
            return result;
        }

        std::vector<ArchitectureSlice> slices = request.slices;
        std::sort(slices.begin(), slices.end(), [](const ArchitectureSlice& left, const ArchitectureSlice& right) {
            return left.architecture < right.architecture;
        });

        for (std::size_t index = 1; index < slices.size(); ++index)
        {
            if (slices[index].architecture == slices[index - 1].architecture)
            {
                result.diagnostics.emplace_back(makeError("LPK-E3102",
                    "architecture '" + slices[index].architecture + "' is supplied more than once."));
            }
        }

        for (const auto& slice : slices)
        {
            std::error_code statusError;
            const auto status = std::filesystem::status(slice.binaryPath, statusError);
            if (statusError || status.type() != std::filesystem::file_type::regular)
            {
                result.diagnostics.emplace_back(makeError("LPK-E3101",
                    "missing binary for architecture '" + slice.architecture + "': expected '"
                        + slice.binaryPath.string()
                        + "'. Check that the project's output file name matches the package name."));
            }
        }

        if (containsErrors(result.diagnostics))
        {
            result.hasError = true;
            return result;
        }

        result.invocation.executable = request.combinerExecutable;
        result.invocation.arguments.emplace_back("-create");
        for (const auto& slice : slices)
        {
            result.invocation.arguments.emplace_back(slice.binaryPath.string());
            result.architectures.push_back(slice.architecture);
        }
        result.invocation.arguments.emplace_back("-output");
        result.invocation.arguments.emplace_back(request.outputPath.string());

        return result;
    }

    CombineResult combine(const CombineRequest& request, ToolRunner& runner)
    {
        CombineResult result;

        auto plan = planCombine(request);
        result.diagnostics = std::move(plan.diagnostics);
        if (plan.hasError)
        {
            result.hasError = true;
            return result;
        }

        std::string errorMessage;
        const auto parentDirectory = request.outputPath.parent_path();
        if (!parentDirectory.empty() && !ensureDirectory(parentDirectory, errorMessage))
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E3104", errorMessage));
            return result;
        }

        std::error_code removeError;
        std::filesystem::remove(request.outputPath, removeError);
        if (removeError)
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E3104",
                "failed to remove stale universal binary '" + request.outputPath.string() + "': " + removeError.message()));
            return result;
        }

        auto run = runner.run(plan.invocation);
        if (!run.launched || run.exitCode != 0)
        {
            result.hasError = true;
            std::string detail = run.launched ? "exited with code " + std::to_string(run.exitCode) : run.errorMessage;
            result.diagnostics.emplace_back(makeError("LPK-E3103",
                "combining architectures into '" + request.outputPath.string() + "' failed: " + detail));
            return result;
        }

        std::error_code statusError;
        if (!std::filesystem::is_regular_file(request.outputPath, statusError) || statusError)
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E3103",
                "combiner reported success but produced no file at '" + request.outputPath.string() + "'."));
            return result;
        }

        result.universalBinary = request.outputPath;
        result.architectures = std::move(plan.architectures);
        return result;
    }
} // namespace linkpack::combiner
