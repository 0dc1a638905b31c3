#include "package_identity.hpp"

#include <algorithm>
#include <cctype>

namespace linkpack
{
    std::string packageDirectoryName(std::string_view name, std::string_view versionTag, std::string_view configuration)
    {
        std::string result{name};
        if (!versionTag.empty())
        {
            result += '-';
            result += versionTag;
        }
        result += '-';
        result += configuration;
        return result;
    }

    std::string packageDirectoryName(const PackageDescriptor& descriptor)
    {
        return packageDirectoryName(descriptor.name, descriptor.versionTag, descriptor.configuration);
    }

    bool validateIdentityComponent(std::string_view value,
        std::string_view description,
        bool allowEmpty,
        std::string& errorMessage)
    {
        if (value.empty())
        {
            if (allowEmpty)
            {
                return true;
            }
            errorMessage = std::string{description} + " must not be empty.";
            return false;
        }

        if (value.front() == '.')
        {
            errorMessage = std::string{description} + " '" + std::string{value} + "' must not start with '.'.";
            return false;
        }

        for (char ch : value)
        {
            if (ch == '/' || ch == '\\' || ch == ':' || std::iscntrl(static_cast<unsigned char>(ch)))
            {
                errorMessage = std::string{description} + " '" + std::string{value}
                    + "' contains a character that cannot appear in a directory name.";
                return false;
            }
        }

        return true;
    }

    bool validateDescriptor(const PackageDescriptor& descriptor, std::string& errorMessage)
    {
        return validateIdentityComponent(descriptor.name, "package name", false, errorMessage)
            && validateIdentityComponent(descriptor.versionTag, "version tag", true, errorMessage)
            && validateIdentityComponent(descriptor.configuration, "configuration", false, errorMessage);
    }

    std::vector<std::string> normalizeArchitectures(const std::vector<std::string>& architectures)
    {
        std::vector<std::string> result = architectures;
        std::sort(result.begin(), result.end());
        result.erase(std::unique(result.begin(), result.end()), result.end());
        return result;
    }

    bool validateArchitectureName(std::string_view architecture, std::string& errorMessage)
    {
        if (architecture.empty())
        {
            errorMessage = "architecture name must not be empty.";
            return false;
        }

        for (unsigned char ch : architecture)
        {
            if (!std::isalnum(ch) && ch != '_' && ch != '-')
            {
                errorMessage = "architecture name '" + std::string{architecture} + "' may only contain letters, digits, '_' and '-'.";
                return false;
            }
        }

        return true;
    }

    std::string sanitizeIdentifier(std::string_view value)
    {
        std::string result;
        result.reserve(value.size());
        for (unsigned char ch : value)
        {
            if (std::isalnum(ch) && ch < 0x80)
            {
                result.push_back(static_cast<char>(std::tolower(ch)));
            }
            else
            {
                result.push_back('_');
            }
        }
        return result;
    }
} // namespace linkpack
