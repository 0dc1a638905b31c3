#include <gtest/gtest.h>

#include "trampoline.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <vector>

namespace linkpack::mutator
{
namespace
{
    TEST(TrampolineTest, DerivesStableSanitizedIdentifier)
    {
        const auto identifier = deriveTrampolineIdentifier("My-Lib", "/work/mylib/Sources/Widget+Extras.m");

        EXPECT_EQ(identifier.rfind("linkpack_force_my_lib_widget_extras_m_", 0), 0u);
        EXPECT_EQ(identifier.size(), std::string{"linkpack_force_my_lib_widget_extras_m_"}.size() + 8);
        EXPECT_EQ(identifier, deriveTrampolineIdentifier("My-Lib", "/elsewhere/Widget+Extras.m"));
    }

    TEST(TrampolineTest, DistinctFileNamesYieldDistinctIdentifiers)
    {
        // Several of these sanitize to the same text and differ only in the hash suffix.
        const std::vector<std::string> fileNames{
            "init.m", "Init.m", "init.mm", "init-m", "init_m", "init+m", "a.c", "A.c", "b.c", "a.cpp"};

        std::set<std::string> identifiers;
        for (const auto& fileName : fileNames)
        {
            identifiers.insert(deriveTrampolineIdentifier("pkg", std::filesystem::path{"/src"} / fileName));
        }

        EXPECT_EQ(identifiers.size(), fileNames.size());
    }

    TEST(TrampolineTest, BlockIsDelimitedAndContainsDeclarationAndDefinition)
    {
        const std::string identifier = "linkpack_force_pkg_init_m_0badf00d";
        const auto block = renderTrampolineBlock(identifier);

        EXPECT_EQ(block.rfind(trampolineBeginMarker, 0), 0u);
        EXPECT_NE(block.find(renderTrampolineDeclaration(identifier)), std::string::npos);
        EXPECT_NE(block.find("void " + identifier + "(void)\n{\n}\n"), std::string::npos);
        EXPECT_EQ(block.substr(block.size() - std::string{trampolineEndMarker}.size() - 1),
            std::string{trampolineEndMarker} + "\n");
        EXPECT_NE(renderTrampolineDeclaration(identifier).find("extern \"C\" {"), std::string::npos);
    }

    TEST(TrampolineTest, PlanRejectsSameFileNameInTwoDirectories)
    {
        auto plan = planTrampolines("pkg", {"/src/a/Init.m", "/src/b/Init.m", "/src/Other.m"});

        EXPECT_TRUE(plan.hasError);
        ASSERT_EQ(plan.diagnostics.size(), 1u);
        EXPECT_EQ(plan.diagnostics.front().code, "LPK-E2003");
        EXPECT_NE(plan.diagnostics.front().message.find("/src/a/Init.m"), std::string::npos);
        EXPECT_NE(plan.diagnostics.front().message.find("/src/b/Init.m"), std::string::npos);
    }

    TEST(TrampolineTest, PlanRejectsUnitListedTwice)
    {
        auto plan = planTrampolines("pkg", {"/src/Init.m", "/src/./Init.m"});

        EXPECT_TRUE(plan.hasError);
        ASSERT_EQ(plan.diagnostics.size(), 1u);
        EXPECT_EQ(plan.diagnostics.front().code, "LPK-E2004");
    }

    TEST(TrampolineTest, PlanKeepsListOrder)
    {
        auto plan = planTrampolines("pkg", {"/src/Zeta.m", "/src/Alpha.m"});

        ASSERT_FALSE(plan.hasError);
        ASSERT_EQ(plan.units.size(), 2u);
        EXPECT_EQ(plan.units[0].path, std::filesystem::path{"/src/Zeta.m"});
        EXPECT_EQ(plan.units[1].path, std::filesystem::path{"/src/Alpha.m"});
        EXPECT_EQ(plan.units[1].identifier, deriveTrampolineIdentifier("pkg", "/src/Alpha.m"));
    }
} // namespace
} // namespace linkpack::mutator
