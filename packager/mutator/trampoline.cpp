#include "trampoline.hpp"

#include "../common/checksum.hpp"
#include "../common/file_io.hpp"
#include "../common/package_identity.hpp"

#include <system_error>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace linkpack::mutator
{
    std::string deriveTrampolineIdentifier(std::string_view packageName, const std::filesystem::path& unitPath)
    {
        const std::string fileName = unitPath.filename().string();

        std::string identifier = "linkpack_force_";
        identifier += sanitizeIdentifier(packageName);
        identifier += '_';
        identifier += sanitizeIdentifier(fileName);
        identifier += '_';
        identifier += toHex(checksum64(fileName), 8);
        return identifier;
    }

    std::string renderTrampolineDeclaration(const std::string& identifier)
    {
        std::string text;
        text += "#ifdef __cplusplus\n";
        text += "extern \"C\" {\n";
        text += "#endif\n";
        text += "void " + identifier + "(void);\n";
        text += "#ifdef __cplusplus\n";
        text += "}\n";
        text += "#endif\n";
        return text;
    }

    std::string renderTrampolineDefinition(const std::string& identifier)
    {
        return "void " + identifier + "(void)\n{\n}\n";
    }

    std::string renderTrampolineBlock(const std::string& identifier)
    {
        std::string block;
        block += trampolineBeginMarker;
        block += '\n';
        block += renderTrampolineDeclaration(identifier);
        block += renderTrampolineDefinition(identifier);
        block += trampolineEndMarker;
        block += '\n';
        return block;
    }

    TrampolinePlan planTrampolines(std::string_view packageName, const std::vector<std::filesystem::path>& unitPaths)
    {
        TrampolinePlan plan;
        plan.units.reserve(unitPaths.size());

        std::unordered_map<std::string, std::filesystem::path> pathsByIdentifier;
        std::unordered_set<std::string> seenPaths;

        for (const auto& rawPath : unitPaths)
        {
            const auto path = absoluteNormal(rawPath);

            if (!seenPaths.insert(path.string()).second)
            {
                plan.diagnostics.emplace_back(makeError("LPK-E2004",
                    "forced-linkage unit '" + path.string() + "' is listed more than once."));
                plan.hasError = true;
                continue;
            }

            std::string identifier = deriveTrampolineIdentifier(packageName, path);
            auto [existing, inserted] = pathsByIdentifier.emplace(identifier, path);
            if (!inserted)
            {
                plan.diagnostics.emplace_back(makeError("LPK-E2003",
                    "forced-linkage units '" + existing->second.string() + "' and '" + path.string()
                        + "' both derive trampoline identifier '" + identifier + "'; rename one of them."));
                plan.hasError = true;
                continue;
            }

            ForcedLinkUnit unit;
            unit.path = path;
            unit.identifier = std::move(identifier);
            plan.units.emplace_back(std::move(unit));
        }

        return plan;
    }
} // namespace linkpack::mutator
