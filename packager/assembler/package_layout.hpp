#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace linkpack::assembler
{
    // <root>/<name>.framework/Versions/A/{<name>,Headers/}, Resources/, Sources/, linkpack.json
    struct PackageLayout
    {
        std::filesystem::path root;
        std::filesystem::path frameworkDirectory;
        std::filesystem::path versionDirectory;
        std::filesystem::path binaryPath;
        std::filesystem::path headersDirectory;
        std::filesystem::path resourcesDirectory;
        std::filesystem::path sourcesDirectory;
        std::filesystem::path manifestPath;
    };

    PackageLayout makePackageLayout(const std::filesystem::path& packageRoot, std::string_view packageName);

    // Versions/Current, Headers and (with a binary) the top-level binary link, all relative
    // so the package can be moved.
    bool createFrameworkLinks(const PackageLayout& layout,
        std::string_view packageName,
        bool hasBinary,
        std::string& errorMessage);
} // namespace linkpack::assembler
