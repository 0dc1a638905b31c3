#include "repository.hpp"

#include "file_io.hpp"

#include <cstdlib>
#include <system_error>

namespace linkpack
{
    RepositoryRootResult resolveRepositoryRoot(const std::filesystem::path& overridePath)
    {
        return resolveRepositoryRoot(overridePath, std::getenv(repositoryEnvironmentVariable), std::getenv("HOME"));
    }

    RepositoryRootResult resolveRepositoryRoot(const std::filesystem::path& overridePath,
        const char* environmentValue,
        const char* homeValue)
    {
        RepositoryRootResult result;

        if (!overridePath.empty())
        {
            result.path = absoluteNormal(overridePath);
            return result;
        }

        if (environmentValue != nullptr && *environmentValue != '\0')
        {
            result.path = absoluteNormal(std::filesystem::path{environmentValue});
            return result;
        }

        if (homeValue == nullptr || *homeValue == '\0')
        {
            result.hasError = true;
            result.errorMessage = std::string{"cannot locate the package repository: HOME is not set; use --repository or "}
                + repositoryEnvironmentVariable + ".";
            return result;
        }

        result.path = absoluteNormal(std::filesystem::path{homeValue} / ".linkpack" / "repository");
        return result;
    }
} // namespace linkpack
