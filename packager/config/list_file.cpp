#include "list_file.hpp"

#include "../common/file_io.hpp"
#include "../common/package_identity.hpp"

#include <cctype>
#include <system_error>
#include <utility>

namespace linkpack::config
{
    namespace
    {
        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        std::vector<std::string> splitWhitespace(std::string_view value)
        {
            std::vector<std::string> tokens;
            std::size_t index = 0;
            while (index < value.size())
            {
                while (index < value.size() && std::isspace(static_cast<unsigned char>(value[index])))
                {
                    ++index;
                }

                const std::size_t start = index;
                while (index < value.size() && !std::isspace(static_cast<unsigned char>(value[index])))
                {
                    ++index;
                }

                if (index > start)
                {
                    tokens.emplace_back(value.substr(start, index - start));
                }
            }
            return tokens;
        }

        std::string location(const std::filesystem::path& sourcePath, std::size_t line)
        {
            return sourcePath.string() + ":" + std::to_string(line);
        }
    } // namespace

    std::vector<ListEntry> parseListContent(std::string_view content)
    {
        std::vector<ListEntry> entries;

        std::size_t lineNumber = 0;
        std::size_t position = 0;
        while (position <= content.size())
        {
            const std::size_t end = content.find('\n', position);
            const std::size_t length = (end == std::string_view::npos ? content.size() : end) - position;
            std::string_view line = trim(content.substr(position, length));
            ++lineNumber;

            if (!line.empty() && line.front() != '#')
            {
                ListEntry entry;
                entry.value = std::string{line};
                entry.line = lineNumber;
                entries.emplace_back(std::move(entry));
            }

            if (end == std::string_view::npos)
            {
                break;
            }
            position = end + 1;
        }

        return entries;
    }

    ListFileResult readListFile(const std::filesystem::path& path)
    {
        ListFileResult result;

        std::error_code statusError;
        const auto status = std::filesystem::status(path, statusError);
        if (statusError || status.type() == std::filesystem::file_type::not_found)
        {
            return result;
        }

        result.found = true;
        if (status.type() != std::filesystem::file_type::regular)
        {
            result.hasError = true;
            result.errorMessage = "list file '" + path.string() + "' is not a regular file.";
            return result;
        }

        auto content = readFile(path);
        if (!content.has_value())
        {
            result.hasError = true;
            result.errorMessage = "unable to read list file '" + path.string() + "'.";
            return result;
        }

        result.entries = parseListContent(*content);
        return result;
    }

    std::vector<std::filesystem::path> resolveListPaths(const std::vector<ListEntry>& entries,
        const std::filesystem::path& baseDirectory)
    {
        std::vector<std::filesystem::path> paths;
        paths.reserve(entries.size());
        for (const auto& entry : entries)
        {
            std::filesystem::path path{entry.value};
            if (path.is_relative())
            {
                path = baseDirectory / path;
            }
            paths.emplace_back(path.lexically_normal());
        }
        return paths;
    }

    DependencyParseResult parseDependencyDeclarations(const std::vector<ListEntry>& entries,
        const std::filesystem::path& sourcePath)
    {
        DependencyParseResult result;

        for (const auto& entry : entries)
        {
            auto tokens = splitWhitespace(entry.value);
            if (tokens.empty())
            {
                continue;
            }

            if (tokens.size() > 2)
            {
                result.diagnostics.emplace_back(makeWarning("LPK-W1101",
                    location(sourcePath, entry.line) + ": expected 'name [version]', skipping '" + entry.value + "'."));
                continue;
            }

            DependencyDeclaration declaration;
            declaration.name = std::move(tokens[0]);
            if (tokens.size() == 2)
            {
                declaration.version = std::move(tokens[1]);
            }
            declaration.line = entry.line;

            std::string errorMessage;
            if (!validateIdentityComponent(declaration.name, "dependency name", false, errorMessage)
                || !validateIdentityComponent(declaration.version, "dependency version", true, errorMessage))
            {
                result.diagnostics.emplace_back(makeWarning("LPK-W1102",
                    location(sourcePath, entry.line) + ": " + errorMessage + " Skipping."));
                continue;
            }

            result.declarations.emplace_back(std::move(declaration));
        }

        return result;
    }
} // namespace linkpack::config
