#include "package_assembler.hpp"

#include "../common/file_io.hpp"
#include "../mutator/trampoline.hpp"
#include "file_classifier.hpp"
#include "package_layout.hpp"

#include <algorithm>
#include <map>
#include <system_error>
#include <utility>

namespace linkpack::assembler
{
    namespace
    {
        std::filesystem::path resolveAgainst(const std::filesystem::path& base, const std::filesystem::path& path)
        {
            if (path.is_absolute())
            {
                return path.lexically_normal();
            }
            return (base / path).lexically_normal();
        }

        std::filesystem::path previousDirectoryFor(const std::filesystem::path& repositoryRoot,
            std::string_view directoryName)
        {
            return repositoryRoot / ("." + std::string{directoryName} + ".previous");
        }

        bool removeTree(const std::filesystem::path& path, std::string& errorMessage)
        {
            std::error_code removeError;
            std::filesystem::remove_all(path, removeError);
            if (removeError)
            {
                errorMessage = "failed to remove '" + path.string() + "': " + removeError.message();
                return false;
            }
            return true;
        }

        void validateHeaders(const AssemblyRequest& request,
            std::vector<std::filesystem::path>& headers,
            std::vector<Diagnostic>& diagnostics)
        {
            std::map<std::string, std::filesystem::path> headersByName;

            for (const auto& header : request.publicHeaders)
            {
                const auto path = resolveAgainst(request.projectRoot, header);

                std::error_code statusError;
                if (!std::filesystem::is_regular_file(path, statusError) || statusError)
                {
                    diagnostics.emplace_back(makeError("LPK-E4001",
                        "public header '" + path.string() + "' does not exist."));
                    continue;
                }

                auto [existing, inserted] = headersByName.emplace(path.filename().string(), path);
                if (!inserted)
                {
                    diagnostics.emplace_back(makeError("LPK-E4002",
                        "public headers '" + existing->second.string() + "' and '" + path.string()
                            + "' would both be installed as '" + path.filename().string() + "'."));
                    continue;
                }

                headers.push_back(path);
            }
        }

        void checkSourcesArePristine(const std::filesystem::path& projectRoot,
            const std::vector<std::filesystem::path>& sources,
            std::vector<Diagnostic>& diagnostics)
        {
            for (const auto& source : sources)
            {
                const auto path = projectRoot / source;
                auto content = readFile(path);
                if (!content.has_value())
                {
                    diagnostics.emplace_back(makeError("LPK-E4005", "unable to read source unit '" + path.string() + "'."));
                    continue;
                }

                if (content->find(mutator::trampolineBeginMarker) != std::string::npos)
                {
                    diagnostics.emplace_back(makeError("LPK-E4005",
                        "source unit '" + path.string() + "' still carries a trampoline block and cannot be embedded."));
                }
            }
        }

        bool populateStaging(const AssemblyRequest& request,
            const PackageLayout& layout,
            const std::vector<std::filesystem::path>& headers,
            const ProjectFiles& projectFiles,
            PackageManifest& manifest,
            std::string& errorMessage)
        {
            const auto& name = request.descriptor.name;
            const bool hasBinary = embedsBinary(request.embedMode);

            if (!ensureDirectory(layout.versionDirectory, errorMessage))
            {
                return false;
            }

            if (hasBinary && !copyRegularFile(request.universalBinary, layout.binaryPath, errorMessage))
            {
                return false;
            }

            if (!createFrameworkLinks(layout, name, hasBinary, errorMessage))
            {
                return false;
            }

            for (const auto& header : headers)
            {
                const auto fileName = header.filename();
                if (!copyRegularFile(header, layout.headersDirectory / fileName, errorMessage))
                {
                    return false;
                }
                manifest.headers.push_back(fileName.generic_string());
            }

            if (!ensureDirectory(layout.resourcesDirectory, errorMessage))
            {
                return false;
            }

            for (const auto& resource : projectFiles.resources)
            {
                if (!copyRegularFile(request.projectRoot / resource, layout.resourcesDirectory / resource, errorMessage))
                {
                    return false;
                }
                manifest.resources.push_back(resource.generic_string());
            }

            if (embedsSource(request.embedMode))
            {
                for (const auto& source : projectFiles.sources)
                {
                    if (!copyRegularFile(request.projectRoot / source, layout.sourcesDirectory / source, errorMessage))
                    {
                        return false;
                    }
                    manifest.sources.push_back(source.generic_string());
                }

                for (const auto& header : projectFiles.headers)
                {
                    if (!copyRegularFile(request.projectRoot / header, layout.sourcesDirectory / header, errorMessage))
                    {
                        return false;
                    }
                    manifest.sources.push_back(header.generic_string());
                }
            }

            if (request.embedMode == EmbedMode::Binary && request.bootstrapUnit.has_value())
            {
                const auto& unit = *request.bootstrapUnit;
                if (!bootstrap::writeBootstrapUnit(layout.root / unit.fileName, unit, errorMessage))
                {
                    return false;
                }
                manifest.bootstrapUnit = unit.fileName;
            }

            std::sort(manifest.headers.begin(), manifest.headers.end());
            std::sort(manifest.sources.begin(), manifest.sources.end());
            return writePackageManifest(layout.manifestPath, manifest, errorMessage);
        }

        bool commitStaging(const std::filesystem::path& staging,
            const std::filesystem::path& finalPath,
            const std::filesystem::path& previous,
            std::string& errorMessage)
        {
            std::error_code existsError;
            const bool hadPrevious = std::filesystem::exists(std::filesystem::symlink_status(finalPath, existsError));

            if (hadPrevious)
            {
                if (!removeTree(previous, errorMessage))
                {
                    return false;
                }

                std::error_code moveError;
                std::filesystem::rename(finalPath, previous, moveError);
                if (moveError)
                {
                    errorMessage = "failed to move previous package '" + finalPath.string() + "' aside: " + moveError.message();
                    return false;
                }
            }

            std::error_code renameError;
            std::filesystem::rename(staging, finalPath, renameError);
            if (renameError)
            {
                errorMessage = "failed to move '" + staging.string() + "' into place: " + renameError.message();
                if (hadPrevious)
                {
                    std::error_code restoreError;
                    std::filesystem::rename(previous, finalPath, restoreError);
                    if (restoreError)
                    {
                        errorMessage += " The previous package remains at '" + previous.string() + "'.";
                    }
                }
                return false;
            }

            if (hadPrevious && !removeTree(previous, errorMessage))
            {
                return false;
            }

            return true;
        }
    } // namespace

    std::optional<EmbedMode> parseEmbedMode(std::string_view value)
    {
        if (value == "binary")
        {
            return EmbedMode::Binary;
        }
        if (value == "source")
        {
            return EmbedMode::Source;
        }
        if (value == "both")
        {
            return EmbedMode::Both;
        }
        return std::nullopt;
    }

    const char* toString(EmbedMode mode)
    {
        switch (mode)
        {
        case EmbedMode::Binary:
            return "binary";
        case EmbedMode::Source:
            return "source";
        case EmbedMode::Both:
            return "both";
        }
        return "unknown";
    }

    bool embedsBinary(EmbedMode mode)
    {
        return mode == EmbedMode::Binary || mode == EmbedMode::Both;
    }

    bool embedsSource(EmbedMode mode)
    {
        return mode == EmbedMode::Source || mode == EmbedMode::Both;
    }

    std::filesystem::path stagingDirectoryFor(const std::filesystem::path& repositoryRoot, std::string_view directoryName)
    {
        return repositoryRoot / ("." + std::string{directoryName} + ".staging");
    }

    AssemblyResult assemblePackage(const AssemblyRequest& request)
    {
        AssemblyResult result;
        const auto& descriptor = request.descriptor;

        std::string errorMessage;
        if (!validateDescriptor(descriptor, errorMessage))
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E4000", errorMessage));
            return result;
        }

        std::vector<std::filesystem::path> headers;
        validateHeaders(request, headers, result.diagnostics);

        if (embedsBinary(request.embedMode))
        {
            std::error_code statusError;
            if (request.universalBinary.empty()
                || !std::filesystem::is_regular_file(request.universalBinary, statusError) || statusError)
            {
                result.diagnostics.emplace_back(makeError("LPK-E4003",
                    "universal binary '" + request.universalBinary.string() + "' does not exist."));
            }
        }

        auto excludedPaths = request.excludedPaths;
        excludedPaths.push_back(request.repositoryRoot);
        auto projectFiles = collectProjectFiles(request.projectRoot, excludedPaths);
        appendDiagnostics(result.diagnostics, projectFiles.diagnostics);

        appendDiagnostics(result.diagnostics,
            checkResourceNames(descriptor.name, request.resourcePrefixSeparator, projectFiles.resources, request.resourcePolicy));

        if (embedsSource(request.embedMode))
        {
            checkSourcesArePristine(request.projectRoot, projectFiles.sources, result.diagnostics);
        }

        if (containsErrors(result.diagnostics))
        {
            result.hasError = true;
            return result;
        }

        if (!ensureDirectory(request.repositoryRoot, errorMessage))
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E4004", errorMessage));
            return result;
        }

        const std::string directoryName = packageDirectoryName(descriptor);
        const auto finalPath = request.repositoryRoot / directoryName;
        const auto staging = stagingDirectoryFor(request.repositoryRoot, directoryName);

        if (!removeTree(staging, errorMessage) || !ensureDirectory(staging, errorMessage))
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E4004", errorMessage));
            return result;
        }

        PackageManifest manifest;
        manifest.name = descriptor.name;
        manifest.versionTag = descriptor.versionTag;
        manifest.configuration = descriptor.configuration;
        manifest.embedMode = toString(request.embedMode);
        if (embedsBinary(request.embedMode))
        {
            manifest.architectures = normalizeArchitectures(descriptor.architectures);
        }

        const auto layout = makePackageLayout(staging, descriptor.name);
        if (!populateStaging(request, layout, headers, projectFiles, manifest, errorMessage)
            || !commitStaging(staging, finalPath, previousDirectoryFor(request.repositoryRoot, directoryName), errorMessage))
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E4006", errorMessage));

            std::string cleanupMessage;
            if (!removeTree(staging, cleanupMessage))
            {
                result.diagnostics.emplace_back(makeWarning("LPK-W4006", cleanupMessage));
            }
            return result;
        }

        result.packagePath = finalPath;
        result.manifest = std::move(manifest);
        return result;
    }
} // namespace linkpack::assembler
