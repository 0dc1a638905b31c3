#pragma once

#include "../common/diagnostic.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace linkpack::mutator
{
    constexpr const char* trampolineBeginMarker = "/* linkpack:forced-linkage begin */";
    constexpr const char* trampolineEndMarker = "/* linkpack:forced-linkage end */";

    struct ForcedLinkUnit
    {
        std::filesystem::path path;
        std::string identifier;
    };

    struct TrampolinePlan
    {
        std::vector<ForcedLinkUnit> units;
        std::vector<Diagnostic> diagnostics;
        bool hasError{false};
    };

    // linkpack_force_<package>_<file name>_<hash of exact file name>
    std::string deriveTrampolineIdentifier(std::string_view packageName, const std::filesystem::path& unitPath);

    // Shared by the mutated unit and the bootstrap unit; the two must stay byte-identical.
    std::string renderTrampolineDeclaration(const std::string& identifier);
    std::string renderTrampolineDefinition(const std::string& identifier);

    // Marker-delimited block appended to a forced-linkage unit.
    std::string renderTrampolineBlock(const std::string& identifier);

    // Derives every identifier and rejects collisions before anything is touched.
    TrampolinePlan planTrampolines(std::string_view packageName, const std::vector<std::filesystem::path>& unitPaths);
} // namespace linkpack::mutator
