#pragma once

#include "../common/diagnostic.hpp"

#include <filesystem>
#include <vector>

namespace linkpack::assembler
{
    enum class FileKind
    {
        Source,
        Header,
        ProjectMetadata,
        Resource
    };

    const char* toString(FileKind kind);

    // Classification is by file name only; no manifest is consulted.
    FileKind classifyFile(const std::filesystem::path& path);

    // Directories such as "Foo.xcodeproj" whose whole subtree is project metadata.
    [[nodiscard]] bool isMetadataDirectory(const std::filesystem::path& path);

    struct ProjectFiles
    {
        // Relative to the project root, sorted.
        std::vector<std::filesystem::path> sources;
        std::vector<std::filesystem::path> headers;
        std::vector<std::filesystem::path> resources;
        std::vector<Diagnostic> diagnostics;
    };

    // Walks the project tree, skipping hidden entries, metadata directories and every path in
    // `excludedPaths` (absolute).
    ProjectFiles collectProjectFiles(const std::filesystem::path& projectRoot,
        const std::vector<std::filesystem::path>& excludedPaths);
} // namespace linkpack::assembler
