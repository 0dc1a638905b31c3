#include "package_manifest.hpp"

#include "../common/file_io.hpp"

#include <sstream>
#include <string_view>

namespace linkpack::assembler
{
    namespace
    {
        char hexDigit(unsigned value)
        {
            return static_cast<char>(value < 10 ? ('0' + value) : ('a' + (value - 10)));
        }

        std::string escapeJson(std::string_view value)
        {
            std::string result;
            result.reserve(value.size() + 8);

            for (unsigned char ch : value)
            {
                switch (ch)
                {
                case '\\':
                    result += "\\\\";
                    break;
                case '"':
                    result += "\\\"";
                    break;
                case '\b':
                    result += "\\b";
                    break;
                case '\f':
                    result += "\\f";
                    break;
                case '\n':
                    result += "\\n";
                    break;
                case '\r':
                    result += "\\r";
                    break;
                case '\t':
                    result += "\\t";
                    break;
                default:
                    if (ch < 0x20)
                    {
                        result += "\\u00";
                        result.push_back(hexDigit((ch >> 4) & 0xF));
                        result.push_back(hexDigit(ch & 0xF));
                    }
                    else
                    {
                        result.push_back(static_cast<char>(ch));
                    }
                    break;
                }
            }

            return result;
        }

        void writeStringArray(std::ostringstream& stream,
            std::string_view key,
            const std::vector<std::string>& values,
            std::string_view indent,
            bool trailingComma)
        {
            stream << indent << "\"" << key << "\": [";
            if (values.empty())
            {
                stream << "]";
            }
            else
            {
                stream << "\n";
                for (std::size_t index = 0; index < values.size(); ++index)
                {
                    stream << indent << "  \"" << escapeJson(values[index]) << "\"";
                    if (index + 1 < values.size())
                    {
                        stream << ",";
                    }
                    stream << "\n";
                }
                stream << indent << "]";
            }

            if (trailingComma)
            {
                stream << ",";
            }
            stream << "\n";
        }
    } // namespace

    std::string renderPackageManifest(const PackageManifest& manifest)
    {
        std::ostringstream stream;

        stream << "{\n";
        stream << "  \"package\": {\n";
        stream << "    \"name\": \"" << escapeJson(manifest.name) << "\",\n";
        if (!manifest.versionTag.empty())
        {
            stream << "    \"version\": \"" << escapeJson(manifest.versionTag) << "\",\n";
        }
        stream << "    \"configuration\": \"" << escapeJson(manifest.configuration) << "\",\n";
        stream << "    \"embed\": \"" << escapeJson(manifest.embedMode) << "\",\n";
        writeStringArray(stream, "architectures", manifest.architectures, "    ", false);
        stream << "  },\n";
        writeStringArray(stream, "headers", manifest.headers, "  ", true);
        writeStringArray(stream, "resources", manifest.resources, "  ", true);
        writeStringArray(stream, "sources", manifest.sources, "  ", manifest.bootstrapUnit.has_value());
        if (manifest.bootstrapUnit.has_value())
        {
            stream << "  \"bootstrap\": \"" << escapeJson(*manifest.bootstrapUnit) << "\"\n";
        }
        stream << "}\n";

        return stream.str();
    }

    bool writePackageManifest(const std::filesystem::path& outputPath,
        const PackageManifest& manifest,
        std::string& errorMessage)
    {
        if (!writeFile(outputPath, renderPackageManifest(manifest), errorMessage))
        {
            errorMessage = "failed to write package manifest: " + errorMessage;
            return false;
        }
        return true;
    }
} // namespace linkpack::assembler
