#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace linkpack
{
    struct PackageDescriptor
    {
        std::string name;
        std::string versionTag;
        std::string configuration{"Release"};
        std::vector<std::string> architectures;
    };

    // "<name>[-<version>]-<configuration>"
    std::string packageDirectoryName(std::string_view name, std::string_view versionTag, std::string_view configuration);
    std::string packageDirectoryName(const PackageDescriptor& descriptor);

    // Package names, version tags and configuration names become path components; rejects
    // empty values (unless allowEmpty), separators and a leading '.'.
    bool validateIdentityComponent(std::string_view value,
        std::string_view description,
        bool allowEmpty,
        std::string& errorMessage);

    bool validateDescriptor(const PackageDescriptor& descriptor, std::string& errorMessage);

    // Sorted and free of duplicates; fusion order never depends on the order given.
    std::vector<std::string> normalizeArchitectures(const std::vector<std::string>& architectures);

    bool validateArchitectureName(std::string_view architecture, std::string& errorMessage);

    // Lower-cases and replaces every character outside [a-z0-9] with '_'.
    std::string sanitizeIdentifier(std::string_view value);
} // namespace linkpack
