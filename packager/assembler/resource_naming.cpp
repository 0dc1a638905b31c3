#include "resource_naming.hpp"

#include <map>

namespace linkpack::assembler
{
    std::optional<ResourcePolicy> parseResourcePolicy(std::string_view value)
    {
        if (value == "warn")
        {
            return ResourcePolicy::Warn;
        }
        if (value == "reject")
        {
            return ResourcePolicy::Reject;
        }
        return std::nullopt;
    }

    const char* toString(ResourcePolicy policy)
    {
        switch (policy)
        {
        case ResourcePolicy::Warn:
            return "warn";
        case ResourcePolicy::Reject:
            return "reject";
        }
        return "unknown";
    }

    bool hasPackagePrefix(std::string_view fileName, std::string_view packageName, std::string_view separator)
    {
        const std::size_t prefixLength = packageName.size() + separator.size();
        return fileName.size() > prefixLength
            && fileName.substr(0, packageName.size()) == packageName
            && fileName.substr(packageName.size(), separator.size()) == separator;
    }

    std::vector<Diagnostic> checkResourceNames(std::string_view packageName,
        std::string_view separator,
        const std::vector<std::filesystem::path>& resources,
        ResourcePolicy policy)
    {
        std::vector<Diagnostic> diagnostics;
        const std::string expectedPrefix = std::string{packageName} + std::string{separator};

        std::map<std::string, std::filesystem::path> firstByName;

        for (const auto& resource : resources)
        {
            const std::string fileName = resource.filename().string();

            if (!hasPackagePrefix(fileName, packageName, separator))
            {
                const std::string message = "resource '" + resource.generic_string() + "' is not prefixed with '"
                    + expectedPrefix + "'; it may collide with resources of other packages.";
                if (policy == ResourcePolicy::Reject)
                {
                    diagnostics.emplace_back(makeError("LPK-E4101", message));
                }
                else
                {
                    diagnostics.emplace_back(makeWarning("LPK-W4101", message));
                }
            }

            auto [existing, inserted] = firstByName.emplace(fileName, resource);
            if (!inserted)
            {
                diagnostics.emplace_back(makeWarning("LPK-W4102",
                    "resources '" + existing->second.generic_string() + "' and '" + resource.generic_string()
                        + "' share the file name '" + fileName + "' and will overwrite each other when flattened."));
            }
        }

        return diagnostics;
    }
} // namespace linkpack::assembler
