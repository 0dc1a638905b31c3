#pragma once

#include "../bootstrap/bootstrap_emitter.hpp"
#include "../common/diagnostic.hpp"
#include "../common/package_identity.hpp"
#include "package_manifest.hpp"
#include "resource_naming.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace linkpack::assembler
{
    enum class EmbedMode
    {
        Binary,
        Source,
        Both
    };

    std::optional<EmbedMode> parseEmbedMode(std::string_view value);
    const char* toString(EmbedMode mode);

    [[nodiscard]] bool embedsBinary(EmbedMode mode);
    [[nodiscard]] bool embedsSource(EmbedMode mode);

    struct AssemblyRequest
    {
        PackageDescriptor descriptor;
        std::filesystem::path projectRoot;
        std::filesystem::path repositoryRoot;
        // Relative entries are resolved against the project root.
        std::vector<std::filesystem::path> publicHeaders;
        std::filesystem::path universalBinary;
        std::optional<bootstrap::BootstrapUnit> bootstrapUnit;
        EmbedMode embedMode{EmbedMode::Binary};
        ResourcePolicy resourcePolicy{ResourcePolicy::Warn};
        std::string resourcePrefixSeparator{"_"};
        // Absolute paths never walked for resources or sources.
        std::vector<std::filesystem::path> excludedPaths;
    };

    struct AssemblyResult
    {
        std::filesystem::path packagePath;
        PackageManifest manifest;
        std::vector<Diagnostic> diagnostics;
        bool hasError{false};
    };

    // Writes the package into a staging directory next to its final location and renames it
    // into place only when complete. On failure nothing appears under the final name and a
    // previous package with the same identity is left untouched.
    AssemblyResult assemblePackage(const AssemblyRequest& request);

    std::filesystem::path stagingDirectoryFor(const std::filesystem::path& repositoryRoot, std::string_view directoryName);
} // namespace linkpack::assembler
