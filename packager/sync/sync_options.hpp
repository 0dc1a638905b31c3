#pragma once

#include <filesystem>
#include <string>

namespace linkpack::sync
{
    struct SyncOptions
    {
        std::filesystem::path workspaceRoot;
        std::filesystem::path dependencyListPath;
        std::filesystem::path repositoryRoot;
        std::string configuration{"Release"};
        bool strict{false};
        bool verbose{false};
    };

    struct SyncCommandLineResult
    {
        SyncOptions options;
        bool showHelp{false};
        bool showVersion{false};
        bool hasError{false};
        std::string errorMessage;
    };

    // Workspace defaults to the current directory, the dependency list to
    // <workspace>/linkpack.deps.
    SyncCommandLineResult parseSyncCommandLine(int argc, char** argv);
} // namespace linkpack::sync
