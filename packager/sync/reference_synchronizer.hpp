#pragma once

#include "../common/diagnostic.hpp"
#include "../config/list_file.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace linkpack::sync
{
    constexpr const char* defaultReferenceDirectoryName = "LinkedPackages";

    enum class ReferenceAction
    {
        Created,
        Updated,
        Unchanged,
        Removed,
        Unresolved
    };

    const char* toString(ReferenceAction action);

    struct ReferenceChange
    {
        std::string name;
        std::filesystem::path linkPath;
        std::filesystem::path target;
        ReferenceAction action{ReferenceAction::Unchanged};
    };

    struct SyncRequest
    {
        std::filesystem::path workspaceRoot;
        std::filesystem::path repositoryRoot;
        std::string configuration{"Release"};
        std::vector<config::DependencyDeclaration> declarations;
        std::string referenceDirectoryName{defaultReferenceDirectoryName};
    };

    struct SyncResult
    {
        std::filesystem::path referenceDirectory;
        std::vector<ReferenceChange> changes;
        std::vector<Diagnostic> diagnostics;
        std::size_t unresolvedCount{0};
        bool hasError{false};
    };

    // Exact match on "<name>[-<version>]-<configuration>" inside the repository.
    std::optional<std::filesystem::path> resolvePackage(const std::filesystem::path& repositoryRoot,
        const config::DependencyDeclaration& declaration,
        const std::string& configuration);

    // Makes the reference directory hold exactly one link per resolvable declaration and
    // removes every other link in it. Unresolvable declarations are reported and skipped;
    // entries that are not symbolic links are never touched.
    SyncResult synchronizeReferences(const SyncRequest& request);
} // namespace linkpack::sync
