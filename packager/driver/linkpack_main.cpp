#include "command_line.hpp"
#include "package_pipeline.hpp"

#include "../common/tool_runner.hpp"

#include <iostream>

#ifndef LINKPACK_VERSION
#define LINKPACK_VERSION "0.1.0"
#endif

namespace linkpack::driver
{
    static void printHelp()
    {
        std::cout << "linkpack - build a multi-architecture package and publish it to a local repository\n"
                     "Usage: linkpack [options]\n\n"
                     "Options:\n"
                     "  --help                    Show this help text and exit.\n"
                     "  --version                 Show version information and exit.\n"
                     "  --project=<path>          Project root. Default: current directory.\n"
                     "  --name=<name>             Package name. Default: project directory name.\n"
                     "  --configuration=<name>    Build configuration. Default: Release.\n"
                     "  --version-tag=<tag>       Version tag appended to the package directory name.\n"
                     "  --embed=<mode>            binary, source or both. Default: binary.\n"
                     "  --min-version=<version>   Minimum platform version passed to the builder.\n"
                     "  --arch=<name>             Target architecture; repeatable. Default: arm64 and x86_64.\n"
                     "  --headers=<path>          Public header list. Default: <project>/linkpack.headers.\n"
                     "  --force-link=<path>       Forced-linkage list. Default: <project>/linkpack.forcelink.\n"
                     "  --repository=<path>       Package repository. Default: $LINKPACK_REPOSITORY, then\n"
                     "                            $HOME/.linkpack/repository.\n"
                     "  --build-root=<path>       Per-architecture output root. Default: <project>/build/linkpack.\n"
                     "  --state-dir=<path>        Snapshot directory. Default: <project>/.linkpack/snapshots.\n"
                     "  --builder=<path>          Build tool invoked once per architecture. Default: make.\n"
                     "  --builder-arg=<template>  Builder argument; repeatable, replaces the defaults.\n"
                     "                            Placeholders: {arch} {configuration} {project} {build_dir}\n"
                     "                            {min_version} {name}.\n"
                     "  --combiner=<path>         Universal binary tool. Default: lipo.\n"
                     "  --resource-policy=<mode>  warn or reject unprefixed resource names. Default: warn.\n"
                     "  --verbose                 Print every tool command line.\n"
                     "  --dry-run                 Print the plan without modifying anything.\n";
    }

    static void printVersion()
    {
        std::cout << "linkpack " << LINKPACK_VERSION << "\n";
    }
} // namespace linkpack::driver

int main(int argc, char** argv)
{
    using namespace linkpack::driver;

    auto result = parseCommandLine(argc, argv);
    if (result.hasError)
    {
        std::cerr << "linkpack: " << result.errorMessage << "\n";
        return 1;
    }

    if (result.showHelp)
    {
        printHelp();
        return 0;
    }

    if (result.showVersion)
    {
        printVersion();
        return 0;
    }

    linkpack::SpawnToolRunner runner;
    auto pipeline = runPackagePipeline(result.options, runner, std::cout, std::cerr);
    return pipeline.exitCode;
}
