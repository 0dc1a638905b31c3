#include "file_io.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace linkpack
{
    std::optional<std::string> readFile(const std::filesystem::path& path)
    {
        std::ifstream stream(path, std::ios::binary);
        if (!stream)
        {
            return std::nullopt;
        }

        std::ostringstream buffer;
        buffer << stream.rdbuf();
        if (stream.bad())
        {
            return std::nullopt;
        }
        return buffer.str();
    }

    bool writeFile(const std::filesystem::path& path, std::string_view content, std::string& errorMessage)
    {
        const auto parentDirectory = path.parent_path();
        if (!parentDirectory.empty() && !ensureDirectory(parentDirectory, errorMessage))
        {
            return false;
        }

        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file)
        {
            errorMessage = "unable to open '" + path.string() + "' for writing.";
            return false;
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file.good())
        {
            errorMessage = "failed while writing '" + path.string() + "'.";
            return false;
        }

        return true;
    }

    bool replaceFile(const std::filesystem::path& path, std::string_view content, std::string& errorMessage)
    {
        const auto temporary = path.parent_path() / ("." + path.filename().string() + ".linkpack-tmp");
        if (!writeFile(temporary, content, errorMessage))
        {
            std::error_code cleanupError;
            std::filesystem::remove(temporary, cleanupError);
            return false;
        }

        std::error_code statusError;
        const auto status = std::filesystem::status(path, statusError);
        if (!statusError && std::filesystem::exists(status))
        {
            std::error_code permissionError;
            std::filesystem::permissions(temporary, status.permissions(), permissionError);
        }

        std::error_code renameError;
        std::filesystem::rename(temporary, path, renameError);
        if (renameError)
        {
            errorMessage = "failed to replace '" + path.string() + "': " + renameError.message();
            std::error_code cleanupError;
            std::filesystem::remove(temporary, cleanupError);
            return false;
        }

        return true;
    }

    bool appendToFile(const std::filesystem::path& path, std::string_view content, std::string& errorMessage)
    {
        std::ofstream file(path, std::ios::binary | std::ios::app);
        if (!file)
        {
            errorMessage = "unable to open '" + path.string() + "' for appending.";
            return false;
        }

        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file.good())
        {
            errorMessage = "failed while appending to '" + path.string() + "'.";
            return false;
        }

        return true;
    }

    bool ensureDirectory(const std::filesystem::path& path, std::string& errorMessage)
    {
        std::error_code statusError;
        const auto status = std::filesystem::status(path, statusError);
        if (!statusError && status.type() == std::filesystem::file_type::directory)
        {
            return true;
        }

        if (!statusError && status.type() != std::filesystem::file_type::not_found)
        {
            errorMessage = "'" + path.string() + "' exists but is not a directory.";
            return false;
        }

        std::error_code createError;
        std::filesystem::create_directories(path, createError);
        if (createError)
        {
            errorMessage = "failed to create directory '" + path.string() + "': " + createError.message();
            return false;
        }

        return true;
    }

    bool isWritableFile(const std::filesystem::path& path)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec) || ec)
        {
            return false;
        }

        std::ofstream probe(path, std::ios::binary | std::ios::app);
        return static_cast<bool>(probe);
    }

    bool probeWritableDirectory(const std::filesystem::path& directory, std::string& errorMessage)
    {
        if (!ensureDirectory(directory, errorMessage))
        {
            return false;
        }

        const auto probePath = directory / ".linkpack-write-probe";
        {
            std::ofstream probe(probePath, std::ios::binary | std::ios::trunc);
            if (!probe)
            {
                errorMessage = "directory '" + directory.string() + "' is not writable.";
                return false;
            }
        }

        std::error_code removeError;
        std::filesystem::remove(probePath, removeError);
        if (removeError)
        {
            errorMessage = "failed to remove write probe in '" + directory.string() + "': " + removeError.message();
            return false;
        }

        return true;
    }

    bool copyRegularFile(const std::filesystem::path& source,
        const std::filesystem::path& destination,
        std::string& errorMessage)
    {
        const auto parentDirectory = destination.parent_path();
        if (!parentDirectory.empty() && !ensureDirectory(parentDirectory, errorMessage))
        {
            return false;
        }

        std::error_code copyError;
        std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing, copyError);
        if (copyError)
        {
            errorMessage = "failed to copy '" + source.string() + "' to '" + destination.string()
                + "': " + copyError.message();
            return false;
        }

        return true;
    }

    std::filesystem::path absoluteNormal(const std::filesystem::path& path)
    {
        std::error_code ec;
        auto absolute = std::filesystem::absolute(path, ec);
        if (ec)
        {
            return path.lexically_normal();
        }
        return absolute.lexically_normal();
    }
} // namespace linkpack
