#pragma once

#include "../common/diagnostic.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace linkpack::assembler
{
    enum class ResourcePolicy
    {
        Warn,
        Reject
    };

    std::optional<ResourcePolicy> parseResourcePolicy(std::string_view value);
    const char* toString(ResourcePolicy policy);

    // Resources end up flattened into the consumer's bundle, so each file name should start
    // with "<package><separator>".
    [[nodiscard]] bool hasPackagePrefix(std::string_view fileName, std::string_view packageName, std::string_view separator);

    // One diagnostic per unprefixed resource (warning or error per policy) and one warning per
    // file name shared by several resources of this package.
    std::vector<Diagnostic> checkResourceNames(std::string_view packageName,
        std::string_view separator,
        const std::vector<std::filesystem::path>& resources,
        ResourcePolicy policy);
} // namespace linkpack::assembler
