#include <gtest/gtest.h>

#include "package_pipeline.hpp"

#include "bootstrap_emitter.hpp"
#include "snapshot_store.hpp"
#include "trampoline.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace linkpack::driver
{
namespace
{
    struct ScopedDirectory
    {
        std::filesystem::path path;
        explicit ScopedDirectory(std::filesystem::path directory) : path(std::move(directory)) {}
        ~ScopedDirectory()
        {
            if (!path.empty())
            {
                std::error_code ec;
                std::filesystem::remove_all(path, ec);
            }
        }
    };

    std::filesystem::path makeTemporaryRoot(const std::string& prefix)
    {
        auto root = std::filesystem::temp_directory_path()
            / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(root);
        return root;
    }

    void writeText(const std::filesystem::path& path, const std::string& content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream stream(path, std::ios::binary);
        stream << content;
    }

    std::string readText(const std::filesystem::path& path)
    {
        std::ifstream stream(path, std::ios::binary);
        return std::string{std::istreambuf_iterator<char>{stream}, std::istreambuf_iterator<char>{}};
    }

    bool hasCode(const std::vector<Diagnostic>& diagnostics, const std::string& code)
    {
        for (const auto& diagnostic : diagnostics)
        {
            if (diagnostic.code == code)
            {
                return true;
            }
        }
        return false;
    }

    // Stands in for both make and lipo. Builder arguments are "{build_dir}" "{name}" "{arch}",
    // so a build writes <build_dir>/lib<name>.a; the combiner writes its last argument.
    class FakeToolchain final : public ToolRunner
    {
    public:
        ToolRunResult run(const ToolInvocation& invocation) override
        {
            ToolRunResult result;
            result.launched = true;

            if (invocation.executable == "fake-lipo")
            {
                ++combineCount;
                writeText(invocation.arguments.back(), "universal");
                return result;
            }

            const auto& buildDirectory = invocation.arguments.at(0);
            const auto& name = invocation.arguments.at(1);
            const auto& architecture = invocation.arguments.at(2);
            builtArchitectures.push_back(architecture);

            if (!watchedUnit.empty())
            {
                unitsDuringBuild.push_back(readText(watchedUnit));
            }

            if (architecture == interruptOn)
            {
                std::raise(SIGINT);
            }

            if (architecture == failOn)
            {
                result.exitCode = 2;
                return result;
            }

            if (architecture != skipOutputFor)
            {
                writeText(std::filesystem::path{buildDirectory} / ("lib" + name + ".a"), architecture);
            }
            return result;
        }

        std::vector<std::string> builtArchitectures;
        std::vector<std::string> unitsDuringBuild;
        std::filesystem::path watchedUnit;
        std::string failOn;
        std::string skipOutputFor;
        std::string interruptOn;
        int combineCount{0};
    };

    constexpr const char* originalUnit = "void mylib_register(void) {}\n";

    class PackagePipelineTest : public ::testing::Test
    {
    protected:
        PackagePipelineTest()
            : m_scratch(makeTemporaryRoot("linkpack-pipeline-"))
        {
            m_project = m_scratch.path / "mylib";
            m_repository = m_scratch.path / "repository";
            m_unit = m_project / "Sources" / "register.c";

            writeText(m_project / "include" / "mylib.h", "void mylib_start(void);\n");
            writeText(m_project / "Sources" / "mylib.c", "void mylib_start(void) {}\n");
            writeText(m_unit, originalUnit);
            writeText(m_project / "linkpack.headers", "include/mylib.h\n");
            writeText(m_project / "linkpack.forcelink", "# units with static registration\nSources/register.c\n");

            m_options.projectRoot = m_project;
            m_options.repositoryRoot = m_repository;
            m_options.builderExecutable = "fake-make";
            m_options.builderArguments = {"{build_dir}", "{name}", "{arch}"};
            m_options.combinerExecutable = "fake-lipo";

            std::string errorMessage;
            const bool defaulted = applyConventionDefaults(m_options, errorMessage);
            EXPECT_TRUE(defaulted) << errorMessage;

            m_toolchain.watchedUnit = m_unit;
        }

        PipelineResult runPipeline()
        {
            return runPackagePipeline(m_options, m_toolchain, m_out, m_err);
        }

        std::filesystem::path packagePath() const
        {
            return m_repository / "mylib-Release";
        }

        ScopedDirectory m_scratch;
        std::filesystem::path m_project;
        std::filesystem::path m_repository;
        std::filesystem::path m_unit;
        PackageOptions m_options;
        FakeToolchain m_toolchain;
        std::ostringstream m_out;
        std::ostringstream m_err;
    };

    TEST_F(PackagePipelineTest, ProducesPackageAndRestoresUnits)
    {
        auto result = runPipeline();

        ASSERT_EQ(result.exitCode, 0) << m_err.str();
        EXPECT_EQ(result.packagePath, packagePath());
        EXPECT_EQ(m_toolchain.builtArchitectures, (std::vector<std::string>{"arm64", "x86_64"}));
        EXPECT_EQ(m_toolchain.combineCount, 1);

        ASSERT_EQ(m_toolchain.unitsDuringBuild.size(), 2u);
        for (const auto& content : m_toolchain.unitsDuringBuild)
        {
            EXPECT_NE(content.find(mutator::trampolineBeginMarker), std::string::npos);
        }
        EXPECT_EQ(readText(m_unit), originalUnit);

        EXPECT_EQ(readText(packagePath() / "mylib.framework" / "Versions" / "A" / "mylib"), "universal");
        EXPECT_TRUE(std::filesystem::is_regular_file(packagePath() / "mylib.framework" / "Headers" / "mylib.h"));
        EXPECT_TRUE(std::filesystem::is_regular_file(packagePath() / bootstrap::bootstrapFileName("mylib")));
        EXPECT_TRUE(std::filesystem::is_regular_file(packagePath() / "linkpack.json"));

        const auto identifier = mutator::deriveTrampolineIdentifier("mylib", m_unit);
        EXPECT_NE(readText(packagePath() / bootstrap::bootstrapFileName("mylib")).find(identifier), std::string::npos);
    }

    TEST_F(PackagePipelineTest, MissingArchitectureBinaryFailsBeforeAssembly)
    {
        m_toolchain.skipOutputFor = "x86_64";

        auto result = runPipeline();

        EXPECT_EQ(result.exitCode, 1);
        EXPECT_TRUE(hasCode(result.diagnostics, "LPK-E3101"));
        EXPECT_EQ(m_toolchain.combineCount, 0);
        EXPECT_FALSE(std::filesystem::exists(packagePath()));
        EXPECT_EQ(readText(m_unit), originalUnit);
    }

    TEST_F(PackagePipelineTest, BuildFailureRestoresUnits)
    {
        m_toolchain.failOn = "arm64";

        auto result = runPipeline();

        EXPECT_EQ(result.exitCode, 1);
        EXPECT_TRUE(hasCode(result.diagnostics, "LPK-E3001"));
        EXPECT_EQ(m_toolchain.builtArchitectures, (std::vector<std::string>{"arm64"}));
        EXPECT_EQ(readText(m_unit), originalUnit);
        EXPECT_FALSE(std::filesystem::exists(packagePath()));
    }

    TEST_F(PackagePipelineTest, InterruptDuringBuildRestoresUnits)
    {
        m_toolchain.interruptOn = "arm64";

        auto result = runPipeline();

        EXPECT_EQ(result.exitCode, 128 + SIGINT);
        EXPECT_TRUE(hasCode(result.diagnostics, "LPK-E1008"));
        EXPECT_EQ(m_toolchain.builtArchitectures, (std::vector<std::string>{"arm64"}));
        EXPECT_EQ(readText(m_unit), originalUnit);
        EXPECT_FALSE(std::filesystem::exists(packagePath()));
    }

    TEST_F(PackagePipelineTest, DryRunTouchesNothing)
    {
        m_options.dryRun = true;

        auto result = runPipeline();

        ASSERT_EQ(result.exitCode, 0) << m_err.str();
        EXPECT_TRUE(m_toolchain.builtArchitectures.empty());
        EXPECT_FALSE(std::filesystem::exists(m_repository));
        EXPECT_FALSE(std::filesystem::exists(m_options.buildRoot));
        EXPECT_FALSE(std::filesystem::exists(m_options.stateDirectory));
        EXPECT_EQ(readText(m_unit), originalUnit);
        EXPECT_NE(m_out.str().find("dry run: nothing was modified."), std::string::npos);
        EXPECT_NE(m_out.str().find("fake-make"), std::string::npos);
    }

    TEST_F(PackagePipelineTest, SourceModeSkipsBuilds)
    {
        m_options.embedMode = assembler::EmbedMode::Source;

        auto result = runPipeline();

        ASSERT_EQ(result.exitCode, 0) << m_err.str();
        EXPECT_TRUE(m_toolchain.builtArchitectures.empty());
        EXPECT_EQ(m_toolchain.combineCount, 0);
        EXPECT_TRUE(std::filesystem::is_regular_file(packagePath() / "Sources" / "Sources" / "register.c"));
        EXPECT_FALSE(std::filesystem::exists(packagePath() / bootstrap::bootstrapFileName("mylib")));
        EXPECT_NE(m_out.str().find("forced-linkage list ignored"), std::string::npos);
    }

    TEST_F(PackagePipelineTest, MissingHeaderListIsFatal)
    {
        std::filesystem::remove(m_project / "linkpack.headers");

        auto result = runPipeline();

        EXPECT_EQ(result.exitCode, 1);
        EXPECT_TRUE(hasCode(result.diagnostics, "LPK-E1003"));
        EXPECT_TRUE(m_toolchain.builtArchitectures.empty());
    }

    TEST_F(PackagePipelineTest, MissingHeaderFailsBeforeMutation)
    {
        writeText(m_project / "linkpack.headers", "include/mylib.h\ninclude/absent.h\n");

        auto result = runPipeline();

        EXPECT_EQ(result.exitCode, 1);
        EXPECT_TRUE(hasCode(result.diagnostics, "LPK-E4001"));
        EXPECT_TRUE(m_toolchain.builtArchitectures.empty());
        EXPECT_FALSE(std::filesystem::exists(m_options.stateDirectory));
    }

    TEST_F(PackagePipelineTest, RejectedResourceFailsBeforeMutation)
    {
        writeText(m_project / "foo.png", "png");
        m_options.resourcePolicy = assembler::ResourcePolicy::Reject;

        auto result = runPipeline();

        EXPECT_EQ(result.exitCode, 1);
        EXPECT_TRUE(hasCode(result.diagnostics, "LPK-E4101"));
        EXPECT_TRUE(m_toolchain.builtArchitectures.empty());
        EXPECT_EQ(m_toolchain.combineCount, 0);
        EXPECT_FALSE(std::filesystem::exists(m_options.stateDirectory));
        EXPECT_EQ(readText(m_unit), originalUnit);
        EXPECT_FALSE(std::filesystem::exists(packagePath()));
    }

    TEST_F(PackagePipelineTest, CustomListFilesAreNotPackagedAsResources)
    {
        std::filesystem::remove(m_project / "linkpack.headers");
        std::filesystem::remove(m_project / "linkpack.forcelink");
        writeText(m_project / "config" / "public.list", "include/mylib.h\n");
        writeText(m_project / "config" / "units.list", "Sources/register.c\n");
        m_options.headerListPath = m_project / "config" / "public.list";
        m_options.forcedLinkListPath = m_project / "config" / "units.list";
        m_options.forcedLinkListExplicit = true;
        m_options.resourcePolicy = assembler::ResourcePolicy::Reject;

        auto result = runPipeline();

        ASSERT_EQ(result.exitCode, 0) << m_err.str();
        EXPECT_FALSE(hasCode(result.diagnostics, "LPK-W4101"));
        EXPECT_FALSE(std::filesystem::exists(packagePath() / "Resources" / "config"));
        EXPECT_TRUE(std::filesystem::is_regular_file(packagePath() / bootstrap::bootstrapFileName("mylib")));
    }

    TEST_F(PackagePipelineTest, MissingDefaultForcedLinkListMeansNoUnits)
    {
        std::filesystem::remove(m_project / "linkpack.forcelink");

        auto result = runPipeline();

        ASSERT_EQ(result.exitCode, 0) << m_err.str();
        ASSERT_EQ(m_toolchain.unitsDuringBuild.size(), 2u);
        EXPECT_EQ(m_toolchain.unitsDuringBuild.front(), originalUnit);
        EXPECT_FALSE(std::filesystem::exists(packagePath() / bootstrap::bootstrapFileName("mylib")));
    }

    TEST_F(PackagePipelineTest, RecoversUnitsLeftMutatedByEarlierRun)
    {
        mutator::SnapshotStore store{m_options.stateDirectory};
        mutator::SnapshotRecord record;
        std::string errorMessage;
        ASSERT_TRUE(store.save(m_unit, originalUnit, std::nullopt, record, errorMessage)) << errorMessage;
        writeText(m_unit,
            std::string{originalUnit} + mutator::renderTrampolineBlock(mutator::deriveTrampolineIdentifier("mylib", m_unit)));

        auto result = runPipeline();

        ASSERT_EQ(result.exitCode, 0) << m_err.str();
        EXPECT_EQ(readText(m_unit), originalUnit);
        EXPECT_NE(m_out.str().find("from an interrupted run"), std::string::npos);
    }
} // namespace
} // namespace linkpack::driver
