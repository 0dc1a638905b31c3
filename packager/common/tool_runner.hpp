#pragma once

#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace linkpack
{
    struct ToolInvocation
    {
        std::filesystem::path executable;
        std::vector<std::string> arguments;
    };

    struct ToolRunResult
    {
        int exitCode{0};
        bool launched{false};
        int terminatingSignal{0};
        std::string errorMessage;
    };

    // Seam between the packaging pipeline and external toolchain processes.
    class ToolRunner
    {
    public:
        virtual ~ToolRunner() = default;

        virtual ToolRunResult run(const ToolInvocation& invocation) = 0;
    };

    // Blocks until the child exits. Looks the executable up on PATH.
    class SpawnToolRunner final : public ToolRunner
    {
    public:
        ToolRunResult run(const ToolInvocation& invocation) override;
    };

    std::string quoteIfNeeded(const std::string& value);

    std::string formatInvocation(const ToolInvocation& invocation);

    void printInvocation(std::ostream& stream, const ToolInvocation& invocation);
} // namespace linkpack
