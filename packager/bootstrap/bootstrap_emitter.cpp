#include "bootstrap_emitter.hpp"

#include "../common/file_io.hpp"
#include "../common/package_identity.hpp"

#include <sstream>

namespace linkpack::bootstrap
{
    std::string bootstrapFileName(std::string_view packageName)
    {
        return std::string{packageName} + "_bootstrap.c";
    }

    std::string bootstrapEntryPoint(std::string_view packageName)
    {
        return "linkpack_bootstrap_" + sanitizeIdentifier(packageName);
    }

    BootstrapUnit renderBootstrapUnit(std::string_view packageName, const std::vector<mutator::ForcedLinkUnit>& units)
    {
        const std::string entryPoint = bootstrapEntryPoint(packageName);
        const std::string tableName = entryPoint + "_table";

        std::ostringstream stream;
        stream << "/* Generated by linkpack for package '" << packageName << "'. Do not edit. */\n";
        stream << "/* Compile this file into the consuming target to keep every unit below linked. */\n";
        stream << "\n";
        stream << "#include <stddef.h>\n";
        stream << "\n";

        for (const auto& unit : units)
        {
            stream << "/* " << unit.path.filename().string() << " */\n";
            stream << mutator::renderTrampolineDeclaration(unit.identifier);
            stream << "\n";
        }

        stream << "#if defined(__GNUC__) || defined(__clang__)\n";
        stream << "#define LINKPACK_BOOTSTRAP_RETAIN __attribute__((used))\n";
        stream << "#else\n";
        stream << "#define LINKPACK_BOOTSTRAP_RETAIN\n";
        stream << "#endif\n";
        stream << "\n";
        stream << "LINKPACK_BOOTSTRAP_RETAIN static void (*const " << tableName << "[])(void) = {\n";
        for (const auto& unit : units)
        {
            stream << "    " << unit.identifier << ",\n";
        }
        stream << "};\n";
        stream << "\n";
        stream << "#ifdef __cplusplus\n";
        stream << "extern \"C\" {\n";
        stream << "#endif\n";
        stream << "void " << entryPoint << "(void);\n";
        stream << "#ifdef __cplusplus\n";
        stream << "}\n";
        stream << "#endif\n";
        stream << "\n";
        stream << "void " << entryPoint << "(void)\n";
        stream << "{\n";
        stream << "    size_t index;\n";
        stream << "    for (index = 0; index < sizeof(" << tableName << ") / sizeof(" << tableName << "[0]); ++index)\n";
        stream << "    {\n";
        stream << "        " << tableName << "[index]();\n";
        stream << "    }\n";
        stream << "}\n";

        BootstrapUnit unit;
        unit.fileName = bootstrapFileName(packageName);
        unit.content = stream.str();
        return unit;
    }

    bool writeBootstrapUnit(const std::filesystem::path& outputPath, const BootstrapUnit& unit, std::string& errorMessage)
    {
        if (!writeFile(outputPath, unit.content, errorMessage))
        {
            errorMessage = "failed to write bootstrap unit: " + errorMessage;
            return false;
        }
        return true;
    }
} // namespace linkpack::bootstrap
