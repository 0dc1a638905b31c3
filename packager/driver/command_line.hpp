#pragma once

#include "../assembler/package_assembler.hpp"
#include "../assembler/resource_naming.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace linkpack::driver
{
    struct PackageOptions
    {
        std::filesystem::path projectRoot;
        std::string packageName;
        std::string configuration{"Release"};
        std::string versionTag;
        std::string minimumVersion;
        std::vector<std::string> architectures;
        assembler::EmbedMode embedMode{assembler::EmbedMode::Binary};
        assembler::ResourcePolicy resourcePolicy{assembler::ResourcePolicy::Warn};
        std::filesystem::path headerListPath;
        std::filesystem::path forcedLinkListPath;
        bool forcedLinkListExplicit{false};
        // Empty defers to LINKPACK_REPOSITORY and the home directory.
        std::filesystem::path repositoryRoot;
        std::filesystem::path buildRoot;
        std::filesystem::path stateDirectory;
        std::filesystem::path builderExecutable{"make"};
        std::vector<std::string> builderArguments;
        std::filesystem::path combinerExecutable{"lipo"};
        bool verbose{false};
        bool dryRun{false};
    };

    struct CommandLineParseResult
    {
        PackageOptions options;
        bool showHelp{false};
        bool showVersion{false};
        bool hasError{false};
        std::string errorMessage;
    };

    std::vector<std::string> defaultArchitectures();

    CommandLineParseResult parseCommandLine(int argc, char** argv);

    // Fills every path left empty with its convention default and makes paths absolute.
    bool applyConventionDefaults(PackageOptions& options, std::string& errorMessage);
} // namespace linkpack::driver
