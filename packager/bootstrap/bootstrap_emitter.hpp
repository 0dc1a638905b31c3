#pragma once

#include "../mutator/trampoline.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace linkpack::bootstrap
{
    struct BootstrapUnit
    {
        std::string fileName;
        std::string content;
    };

    // "<package>_bootstrap.c"
    std::string bootstrapFileName(std::string_view packageName);

    // "linkpack_bootstrap_<package>", the exported driver the consumer may call.
    std::string bootstrapEntryPoint(std::string_view packageName);

    // Mirrors every trampoline declaration and references each one from a retained table, so
    // linking this unit pulls in every forced-linkage unit of the binary.
    BootstrapUnit renderBootstrapUnit(std::string_view packageName, const std::vector<mutator::ForcedLinkUnit>& units);

    bool writeBootstrapUnit(const std::filesystem::path& outputPath, const BootstrapUnit& unit, std::string& errorMessage);
} // namespace linkpack::bootstrap
