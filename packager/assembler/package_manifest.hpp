#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace linkpack::assembler
{
    struct PackageManifest
    {
        std::string name;
        std::string versionTag;
        std::string configuration;
        std::string embedMode;
        std::vector<std::string> architectures;
        std::vector<std::string> headers;
        std::vector<std::string> resources;
        std::vector<std::string> sources;
        std::optional<std::string> bootstrapUnit;
    };

    constexpr const char* packageManifestFileName = "linkpack.json";

    // Deterministic: no timestamps, lists written in the order given.
    std::string renderPackageManifest(const PackageManifest& manifest);

    bool writePackageManifest(const std::filesystem::path& outputPath,
        const PackageManifest& manifest,
        std::string& errorMessage);
} // namespace linkpack::assembler
