#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace linkpack
{
    std::optional<std::string> readFile(const std::filesystem::path& path);

    // Truncates and rewrites the file, creating missing parent directories.
    bool writeFile(const std::filesystem::path& path, std::string_view content, std::string& errorMessage);

    // Writes a hidden sibling file and renames it over `path`, so readers see either the old or
    // the new content. Permissions of an existing file are kept.
    bool replaceFile(const std::filesystem::path& path, std::string_view content, std::string& errorMessage);

    bool appendToFile(const std::filesystem::path& path, std::string_view content, std::string& errorMessage);

    bool ensureDirectory(const std::filesystem::path& path, std::string& errorMessage);

    // Opens the file for appending without writing; true when that succeeds.
    [[nodiscard]] bool isWritableFile(const std::filesystem::path& path);

    // Creates and removes a probe file inside the directory.
    bool probeWritableDirectory(const std::filesystem::path& directory, std::string& errorMessage);

    bool copyRegularFile(const std::filesystem::path& source,
        const std::filesystem::path& destination,
        std::string& errorMessage);

    // Absolute and lexically normal; falls back to the normalised input when the current
    // directory is unavailable.
    std::filesystem::path absoluteNormal(const std::filesystem::path& path);
} // namespace linkpack
