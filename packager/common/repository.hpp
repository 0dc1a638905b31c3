#pragma once

#include <filesystem>
#include <string>

namespace linkpack
{
    constexpr const char* repositoryEnvironmentVariable = "LINKPACK_REPOSITORY";

    struct RepositoryRootResult
    {
        std::filesystem::path path;
        bool hasError{false};
        std::string errorMessage;
    };

    // Explicit override, then LINKPACK_REPOSITORY, then $HOME/.linkpack/repository.
    RepositoryRootResult resolveRepositoryRoot(const std::filesystem::path& overridePath);

    RepositoryRootResult resolveRepositoryRoot(const std::filesystem::path& overridePath,
        const char* environmentValue,
        const char* homeValue);
} // namespace linkpack
