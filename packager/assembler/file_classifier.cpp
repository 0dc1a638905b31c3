#include "file_classifier.hpp"

#include "../config/list_file.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <system_error>

namespace linkpack::assembler
{
    namespace
    {
        constexpr std::array<std::string_view, 9> sourceExtensions{
            ".c", ".cc", ".cpp", ".cxx", ".m", ".mm", ".s", ".S", ".swift"};
        constexpr std::array<std::string_view, 6> headerExtensions{".h", ".hh", ".hpp", ".hxx", ".inl", ".ipp"};
        constexpr std::array<std::string_view, 4> metadataExtensions{".pbxproj", ".xcconfig", ".xcscheme", ".cmake"};
        constexpr std::array<std::string_view, 2> metadataDirectoryExtensions{".xcodeproj", ".xcworkspace"};

        template <std::size_t Size>
        bool matches(const std::array<std::string_view, Size>& candidates, std::string_view value)
        {
            return std::find(candidates.begin(), candidates.end(), value) != candidates.end();
        }

        bool isMetadataFileName(std::string_view name)
        {
            return name == "CMakeLists.txt" || name == "Makefile" || name == "GNUmakefile"
                || name == config::defaultForcedLinkListName || name == config::defaultHeaderListName
                || name == config::defaultDependencyListName;
        }

        bool isHidden(const std::filesystem::path& path)
        {
            const auto name = path.filename().string();
            return !name.empty() && name.front() == '.';
        }

        bool isExcluded(const std::filesystem::path& path, const std::vector<std::filesystem::path>& excludedPaths)
        {
            const auto normalised = path.lexically_normal();
            return std::find(excludedPaths.begin(), excludedPaths.end(), normalised) != excludedPaths.end();
        }
    } // namespace

    const char* toString(FileKind kind)
    {
        switch (kind)
        {
        case FileKind::Source:
            return "source";
        case FileKind::Header:
            return "header";
        case FileKind::ProjectMetadata:
            return "metadata";
        case FileKind::Resource:
            return "resource";
        }
        return "unknown";
    }

    FileKind classifyFile(const std::filesystem::path& path)
    {
        const auto name = path.filename().string();
        if (isMetadataFileName(name))
        {
            return FileKind::ProjectMetadata;
        }

        const auto extension = path.extension().string();
        if (matches(sourceExtensions, extension))
        {
            return FileKind::Source;
        }
        if (matches(headerExtensions, extension))
        {
            return FileKind::Header;
        }
        if (matches(metadataExtensions, extension))
        {
            return FileKind::ProjectMetadata;
        }
        return FileKind::Resource;
    }

    bool isMetadataDirectory(const std::filesystem::path& path)
    {
        return matches(metadataDirectoryExtensions, path.extension().string());
    }

    ProjectFiles collectProjectFiles(const std::filesystem::path& projectRoot,
        const std::vector<std::filesystem::path>& excludedPaths)
    {
        ProjectFiles files;

        std::vector<std::filesystem::path> normalisedExclusions;
        normalisedExclusions.reserve(excludedPaths.size());
        for (const auto& excluded : excludedPaths)
        {
            auto normalised = excluded.lexically_normal();
            if (!normalised.has_filename() && normalised.has_parent_path())
            {
                normalised = normalised.parent_path();
            }
            normalisedExclusions.push_back(std::move(normalised));
        }

        std::error_code iteratorError;
        std::filesystem::recursive_directory_iterator it(projectRoot,
            std::filesystem::directory_options::skip_permission_denied,
            iteratorError);
        if (iteratorError)
        {
            files.diagnostics.emplace_back(makeError("LPK-E4010",
                "failed to enumerate project root '" + projectRoot.string() + "': " + iteratorError.message()));
            return files;
        }

        std::filesystem::recursive_directory_iterator end;
        while (it != end)
        {
            const auto& entry = *it;
            const std::filesystem::path path = entry.path();

            std::error_code entryError;
            const bool isDirectory = entry.is_directory(entryError);

            if (isHidden(path) || isExcluded(path, normalisedExclusions) || (isDirectory && isMetadataDirectory(path)))
            {
                if (isDirectory)
                {
                    it.disable_recursion_pending();
                }
            }
            else if (!isDirectory && entry.is_regular_file(entryError) && !entryError)
            {
                auto relative = path.lexically_relative(projectRoot);
                switch (classifyFile(path))
                {
                case FileKind::Source:
                    files.sources.emplace_back(std::move(relative));
                    break;
                case FileKind::Header:
                    files.headers.emplace_back(std::move(relative));
                    break;
                case FileKind::Resource:
                    files.resources.emplace_back(std::move(relative));
                    break;
                case FileKind::ProjectMetadata:
                    break;
                }
            }

            std::error_code incrementError;
            it.increment(incrementError);
            if (incrementError)
            {
                files.diagnostics.emplace_back(makeError("LPK-E4010",
                    "failed to enumerate project root near '" + path.string() + "': " + incrementError.message()));
                break;
            }
        }

        std::sort(files.sources.begin(), files.sources.end());
        std::sort(files.headers.begin(), files.headers.end());
        std::sort(files.resources.begin(), files.resources.end());
        return files;
    }
} // namespace linkpack::assembler
