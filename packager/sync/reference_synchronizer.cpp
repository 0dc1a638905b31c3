#include "reference_synchronizer.hpp"

#include "../common/file_io.hpp"
#include "../common/package_identity.hpp"

#include <algorithm>
#include <set>
#include <system_error>
#include <utility>

namespace linkpack::sync
{
    namespace
    {
        bool createReference(const std::filesystem::path& target,
            const std::filesystem::path& link,
            std::string& errorMessage)
        {
            std::error_code linkError;
            std::filesystem::create_directory_symlink(target, link, linkError);
            if (linkError)
            {
                errorMessage = "failed to link '" + link.string() + "' to '" + target.string() + "': " + linkError.message();
                return false;
            }
            return true;
        }

        std::optional<ReferenceChange> ensureReference(const std::string& name,
            const std::filesystem::path& target,
            const std::filesystem::path& referenceDirectory,
            std::vector<Diagnostic>& diagnostics)
        {
            ReferenceChange change;
            change.name = name;
            change.linkPath = referenceDirectory / name;
            change.target = target;

            std::error_code statusError;
            const auto status = std::filesystem::symlink_status(change.linkPath, statusError);
            std::string errorMessage;

            if (status.type() == std::filesystem::file_type::not_found)
            {
                if (!createReference(target, change.linkPath, errorMessage))
                {
                    diagnostics.emplace_back(makeError("LPK-E5003", errorMessage));
                    return std::nullopt;
                }
                change.action = ReferenceAction::Created;
                return change;
            }

            if (statusError)
            {
                diagnostics.emplace_back(makeError("LPK-E5003",
                    "failed to inspect '" + change.linkPath.string() + "': " + statusError.message()));
                return std::nullopt;
            }

            if (status.type() != std::filesystem::file_type::symlink)
            {
                diagnostics.emplace_back(makeError("LPK-E5004",
                    "'" + change.linkPath.string() + "' exists and is not a symbolic link; remove it to reference '"
                        + name + "'."));
                return std::nullopt;
            }

            std::error_code readError;
            const auto currentTarget = std::filesystem::read_symlink(change.linkPath, readError);
            if (!readError && currentTarget.lexically_normal() == target.lexically_normal())
            {
                change.action = ReferenceAction::Unchanged;
                return change;
            }

            std::error_code removeError;
            std::filesystem::remove(change.linkPath, removeError);
            if (removeError)
            {
                diagnostics.emplace_back(makeError("LPK-E5003",
                    "failed to replace stale reference '" + change.linkPath.string() + "': " + removeError.message()));
                return std::nullopt;
            }

            if (!createReference(target, change.linkPath, errorMessage))
            {
                diagnostics.emplace_back(makeError("LPK-E5003", errorMessage));
                return std::nullopt;
            }

            change.action = ReferenceAction::Updated;
            return change;
        }

        void pruneReferences(const std::filesystem::path& referenceDirectory,
            const std::set<std::string>& keep,
            SyncResult& result)
        {
            std::error_code iteratorError;
            std::filesystem::directory_iterator it(referenceDirectory, iteratorError);
            if (iteratorError)
            {
                result.diagnostics.emplace_back(makeError("LPK-E5005",
                    "failed to enumerate '" + referenceDirectory.string() + "': " + iteratorError.message()));
                return;
            }

            std::vector<std::filesystem::path> stale;
            for (const auto& entry : it)
            {
                std::error_code statusError;
                if (!entry.is_symlink(statusError) || statusError)
                {
                    continue;
                }

                if (keep.count(entry.path().filename().string()) == 0)
                {
                    stale.push_back(entry.path());
                }
            }

            std::sort(stale.begin(), stale.end());

            for (const auto& link : stale)
            {
                ReferenceChange change;
                change.name = link.filename().string();
                change.linkPath = link;

                std::error_code readError;
                change.target = std::filesystem::read_symlink(link, readError);

                std::error_code removeError;
                std::filesystem::remove(link, removeError);
                if (removeError)
                {
                    result.diagnostics.emplace_back(makeError("LPK-E5005",
                        "failed to remove stale reference '" + link.string() + "': " + removeError.message()));
                    continue;
                }

                change.action = ReferenceAction::Removed;
                result.changes.emplace_back(std::move(change));
            }
        }
    } // namespace

    const char* toString(ReferenceAction action)
    {
        switch (action)
        {
        case ReferenceAction::Created:
            return "created";
        case ReferenceAction::Updated:
            return "updated";
        case ReferenceAction::Unchanged:
            return "unchanged";
        case ReferenceAction::Removed:
            return "removed";
        case ReferenceAction::Unresolved:
            return "unresolved";
        }
        return "unknown";
    }

    std::optional<std::filesystem::path> resolvePackage(const std::filesystem::path& repositoryRoot,
        const config::DependencyDeclaration& declaration,
        const std::string& configuration)
    {
        const auto candidate = repositoryRoot / packageDirectoryName(declaration.name, declaration.version, configuration);

        std::error_code statusError;
        if (std::filesystem::is_directory(candidate, statusError) && !statusError)
        {
            return candidate;
        }
        return std::nullopt;
    }

    SyncResult synchronizeReferences(const SyncRequest& request)
    {
        SyncResult result;

        const auto repositoryRoot = absoluteNormal(request.repositoryRoot);
        const auto workspaceRoot = absoluteNormal(request.workspaceRoot);

        std::error_code repositoryError;
        const auto repositoryStatus = std::filesystem::status(repositoryRoot, repositoryError);
        if (repositoryError || repositoryStatus.type() != std::filesystem::file_type::directory)
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E5002",
                "package repository '" + repositoryRoot.string() + "' does not exist or is not a directory."));
            return result;
        }

        result.referenceDirectory = workspaceRoot / request.referenceDirectoryName;

        std::string errorMessage;
        if (!ensureDirectory(result.referenceDirectory, errorMessage))
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E5001", errorMessage));
            return result;
        }

        std::set<std::string> declaredNames;
        std::set<std::string> keep;

        for (const auto& declaration : request.declarations)
        {
            if (!declaredNames.insert(declaration.name).second)
            {
                result.diagnostics.emplace_back(makeWarning("LPK-W5002",
                    "dependency '" + declaration.name + "' is declared more than once (line "
                        + std::to_string(declaration.line) + "); keeping the first declaration."));
                continue;
            }

            auto resolved = resolvePackage(repositoryRoot, declaration, request.configuration);
            if (!resolved.has_value())
            {
                ++result.unresolvedCount;
                result.diagnostics.emplace_back(makeWarning("LPK-W5001",
                    "no package '" + packageDirectoryName(declaration.name, declaration.version, request.configuration)
                        + "' in repository '" + repositoryRoot.string() + "'."));

                ReferenceChange change;
                change.name = declaration.name;
                change.linkPath = result.referenceDirectory / declaration.name;
                change.action = ReferenceAction::Unresolved;
                result.changes.emplace_back(std::move(change));
                continue;
            }

            auto change = ensureReference(declaration.name, *resolved, result.referenceDirectory, result.diagnostics);
            if (change.has_value())
            {
                keep.insert(declaration.name);
                result.changes.emplace_back(std::move(*change));
            }
        }

        pruneReferences(result.referenceDirectory, keep, result);

        result.hasError = containsErrors(result.diagnostics);
        return result;
    }
} // namespace linkpack::sync
