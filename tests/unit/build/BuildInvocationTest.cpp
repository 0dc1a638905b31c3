#include <gtest/gtest.h>

#include "build_invocation.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace linkpack::build
{
namespace
{
    class ScriptedRunner final : public ToolRunner
    {
    public:
        ToolRunResult run(const ToolInvocation& invocation) override
        {
            invocations.push_back(invocation);
            return next;
        }

        std::vector<ToolInvocation> invocations;
        ToolRunResult next{0, true, 0, {}};
    };

    BuildRequest makeRequest()
    {
        BuildRequest request;
        request.packageName = "mylib";
        request.configuration = "Debug";
        request.architectures = {"x86_64", "arm64"};
        request.projectRoot = "/work/mylib";
        request.buildRoot = "/work/mylib/build/linkpack";
        request.minimumVersion = "12.0";
        return request;
    }

    TEST(BuildInvocationTest, ExpandsKnownPlaceholders)
    {
        TemplateVariables variables{{"arch", "arm64"}, {"name", "mylib"}};

        std::string expanded;
        std::string errorMessage;
        ASSERT_TRUE(expandTemplate("ARCHS={arch} TARGET={name}_{arch}", variables, expanded, errorMessage));
        EXPECT_EQ(expanded, "ARCHS=arm64 TARGET=mylib_arm64");

        ASSERT_TRUE(expandTemplate("plain", variables, expanded, errorMessage));
        EXPECT_EQ(expanded, "plain");
    }

    TEST(BuildInvocationTest, RejectsUnknownAndUnterminatedPlaceholders)
    {
        TemplateVariables variables{{"arch", "arm64"}};

        std::string expanded;
        std::string errorMessage;
        EXPECT_FALSE(expandTemplate("SDK={sdk}", variables, expanded, errorMessage));
        EXPECT_EQ(errorMessage, "unknown placeholder '{sdk}' in 'SDK={sdk}'.");

        EXPECT_FALSE(expandTemplate("ARCH={arch", variables, expanded, errorMessage));
        EXPECT_EQ(errorMessage, "unterminated placeholder in 'ARCH={arch'.");
    }

    TEST(BuildInvocationTest, PlansOneBuildPerArchitectureInSortedOrder)
    {
        auto plan = planArchitectureBuilds(makeRequest());
        ASSERT_FALSE(plan.hasError) << plan.errorMessage;
        ASSERT_EQ(plan.builds.size(), 2u);

        const auto& arm = plan.builds[0];
        EXPECT_EQ(arm.architecture, "arm64");
        EXPECT_EQ(arm.invocation.executable, std::filesystem::path{"make"});
        EXPECT_EQ(arm.outputDirectory, std::filesystem::path{"/work/mylib/build/linkpack/Debug-arm64"});
        EXPECT_EQ(arm.expectedBinary, std::filesystem::path{"/work/mylib/build/linkpack/Debug-arm64/libmylib.a"});
        EXPECT_EQ(arm.invocation.arguments,
            (std::vector<std::string>{"-C",
                "/work/mylib",
                "ARCH=arm64",
                "CONFIGURATION=Debug",
                "BUILD_DIR=/work/mylib/build/linkpack/Debug-arm64",
                "MIN_VERSION=12.0"}));

        EXPECT_EQ(plan.builds[1].architecture, "x86_64");
    }

    TEST(BuildInvocationTest, CustomArgumentsReplaceDefaults)
    {
        auto request = makeRequest();
        request.architectures = {"arm64"};
        request.builderExecutable = "xcodebuild";
        request.builderArguments = {"-scheme", "{name}", "-arch", "{arch}", "CONFIGURATION_BUILD_DIR={build_dir}"};

        auto plan = planArchitectureBuilds(request);
        ASSERT_FALSE(plan.hasError) << plan.errorMessage;
        ASSERT_EQ(plan.builds.size(), 1u);
        EXPECT_EQ(plan.builds[0].invocation.executable, std::filesystem::path{"xcodebuild"});
        EXPECT_EQ(plan.builds[0].invocation.arguments,
            (std::vector<std::string>{"-scheme",
                "mylib",
                "-arch",
                "arm64",
                "CONFIGURATION_BUILD_DIR=/work/mylib/build/linkpack/Debug-arm64"}));
    }

    TEST(BuildInvocationTest, PlanRejectsEmptyArchitectureSetAndBadTemplates)
    {
        auto request = makeRequest();
        request.architectures.clear();
        auto empty = planArchitectureBuilds(request);
        EXPECT_TRUE(empty.hasError);
        EXPECT_EQ(empty.errorMessage, "at least one target architecture is required.");

        request = makeRequest();
        request.builderArguments = {"{sdk}"};
        auto badTemplate = planArchitectureBuilds(request);
        EXPECT_TRUE(badTemplate.hasError);
    }

    TEST(BuildInvocationTest, RunReportsFailingArchitecture)
    {
        const auto root = std::filesystem::temp_directory_path()
            / ("linkpack-build-run-" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));

        auto request = makeRequest();
        request.buildRoot = root;
        auto plan = planArchitectureBuilds(request);
        ASSERT_FALSE(plan.hasError);

        ScriptedRunner runner;
        auto success = runArchitectureBuild(plan.builds[0], runner);
        EXPECT_FALSE(success.hasError);
        EXPECT_TRUE(std::filesystem::is_directory(plan.builds[0].outputDirectory));

        runner.next.exitCode = 2;
        auto failure = runArchitectureBuild(plan.builds[1], runner);
        EXPECT_TRUE(failure.hasError);
        ASSERT_EQ(failure.diagnostics.size(), 1u);
        EXPECT_EQ(failure.diagnostics.front().code, "LPK-E3001");
        EXPECT_NE(failure.diagnostics.front().message.find("'x86_64'"), std::string::npos);

        runner.next.exitCode = 0;
        runner.next.terminatingSignal = SIGTERM;
        auto killed = runArchitectureBuild(plan.builds[0], runner);
        EXPECT_TRUE(killed.hasError);
        EXPECT_EQ(killed.terminatingSignal, SIGTERM);

        runner.next = ToolRunResult{};
        runner.next.errorMessage = "No such file or directory";
        auto notLaunched = runArchitectureBuild(plan.builds[0], runner);
        EXPECT_TRUE(notLaunched.hasError);
        ASSERT_EQ(notLaunched.diagnostics.size(), 1u);
        EXPECT_EQ(notLaunched.diagnostics.front().code, "LPK-E3003");

        std::error_code cleanupError;
        std::filesystem::remove_all(root, cleanupError);
    }
} // namespace
} // namespace linkpack::build
