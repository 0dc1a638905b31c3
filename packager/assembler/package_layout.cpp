#include "package_layout.hpp"

#include "../common/file_io.hpp"
#include "package_manifest.hpp"

#include <system_error>

namespace linkpack::assembler
{
    namespace
    {
        constexpr const char* frameworkVersion = "A";

        bool createLink(const std::filesystem::path& target,
            const std::filesystem::path& link,
            bool directory,
            std::string& errorMessage)
        {
            std::error_code linkError;
            if (directory)
            {
                std::filesystem::create_directory_symlink(target, link, linkError);
            }
            else
            {
                std::filesystem::create_symlink(target, link, linkError);
            }

            if (linkError)
            {
                errorMessage = "failed to create link '" + link.string() + "' -> '" + target.string()
                    + "': " + linkError.message();
                return false;
            }
            return true;
        }
    } // namespace

    PackageLayout makePackageLayout(const std::filesystem::path& packageRoot, std::string_view packageName)
    {
        const std::string name{packageName};

        PackageLayout layout;
        layout.root = packageRoot;
        layout.frameworkDirectory = packageRoot / (name + ".framework");
        layout.versionDirectory = layout.frameworkDirectory / "Versions" / frameworkVersion;
        layout.binaryPath = layout.versionDirectory / name;
        layout.headersDirectory = layout.versionDirectory / "Headers";
        layout.resourcesDirectory = packageRoot / "Resources";
        layout.sourcesDirectory = packageRoot / "Sources";
        layout.manifestPath = packageRoot / packageManifestFileName;
        return layout;
    }

    bool createFrameworkLinks(const PackageLayout& layout,
        std::string_view packageName,
        bool hasBinary,
        std::string& errorMessage)
    {
        if (!ensureDirectory(layout.headersDirectory, errorMessage))
        {
            return false;
        }

        const std::string name{packageName};
        const auto versionsDirectory = layout.frameworkDirectory / "Versions";

        if (!createLink(frameworkVersion, versionsDirectory / "Current", true, errorMessage))
        {
            return false;
        }

        if (!createLink(std::filesystem::path{"Versions"} / "Current" / "Headers",
                layout.frameworkDirectory / "Headers",
                true,
                errorMessage))
        {
            return false;
        }

        if (hasBinary
            && !createLink(std::filesystem::path{"Versions"} / "Current" / name,
                layout.frameworkDirectory / name,
                false,
                errorMessage))
        {
            return false;
        }

        return true;
    }
} // namespace linkpack::assembler
