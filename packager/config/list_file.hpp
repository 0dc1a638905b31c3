#pragma once

#include "../common/diagnostic.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace linkpack::config
{
    constexpr const char* defaultForcedLinkListName = "linkpack.forcelink";
    constexpr const char* defaultHeaderListName = "linkpack.headers";
    constexpr const char* defaultDependencyListName = "linkpack.deps";

    struct ListEntry
    {
        std::string value;
        std::size_t line{0};
    };

    struct ListFileResult
    {
        std::vector<ListEntry> entries;
        bool found{false};
        bool hasError{false};
        std::string errorMessage;
    };

    // One entry per line; whitespace trimmed, blank lines and '#' comments dropped.
    std::vector<ListEntry> parseListContent(std::string_view content);

    // A missing file is reported through `found`, not as an error.
    ListFileResult readListFile(const std::filesystem::path& path);

    std::vector<std::filesystem::path> resolveListPaths(const std::vector<ListEntry>& entries,
        const std::filesystem::path& baseDirectory);

    struct DependencyDeclaration
    {
        std::string name;
        std::string version;
        std::size_t line{0};
    };

    struct DependencyParseResult
    {
        std::vector<DependencyDeclaration> declarations;
        std::vector<Diagnostic> diagnostics;
    };

    // Lines are "name" or "name version".
    DependencyParseResult parseDependencyDeclarations(const std::vector<ListEntry>& entries,
        const std::filesystem::path& sourcePath);
} // namespace linkpack::config
