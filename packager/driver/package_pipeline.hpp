#pragma once

#include "../common/diagnostic.hpp"
#include "../common/tool_runner.hpp"
#include "command_line.hpp"

#include <filesystem>
#include <ostream>
#include <vector>

namespace linkpack::driver
{
    struct PipelineResult
    {
        int exitCode{0};
        std::filesystem::path packagePath;
        std::filesystem::path universalBinary;
        std::vector<Diagnostic> diagnostics;
    };

    // Recover, mutate, build every architecture, restore, combine, emit the bootstrap unit and
    // assemble. Progress goes to `out` as [notice] lines, diagnostics to `err` as they occur.
    // Mutated units are restored on every path out of this function.
    PipelineResult runPackagePipeline(const PackageOptions& options,
        ToolRunner& runner,
        std::ostream& out,
        std::ostream& err);

    // <build root>/<configuration>-universal/lib<name>.a
    std::filesystem::path universalBinaryPath(const PackageOptions& options);
} // namespace linkpack::driver
