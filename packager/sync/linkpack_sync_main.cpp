#include "sync_options.hpp"
#include "sync_runner.hpp"

#include <iostream>

#ifndef LINKPACK_VERSION
#define LINKPACK_VERSION "0.1.0"
#endif

namespace linkpack::sync
{
    static void printHelp()
    {
        std::cout << "linkpack-sync - link declared packages into a consumer workspace\n"
                     "Usage: linkpack-sync [options]\n\n"
                     "Options:\n"
                     "  --help                    Show this help text and exit.\n"
                     "  --version                 Show version information and exit.\n"
                     "  --workspace=<path>        Consumer workspace root. Default: current directory.\n"
                     "  --deps=<path>             Dependency list. Default: <workspace>/linkpack.deps.\n"
                     "  --repository=<path>       Package repository. Default: $LINKPACK_REPOSITORY, then\n"
                     "                            $HOME/.linkpack/repository.\n"
                     "  --configuration=<name>    Configuration to reference. Default: Release.\n"
                     "  --strict                  Exit with status 1 when a dependency does not resolve.\n"
                     "  --verbose                 Report unchanged references as well.\n";
    }

    static void printVersion()
    {
        std::cout << "linkpack-sync " << LINKPACK_VERSION << "\n";
    }
} // namespace linkpack::sync

int main(int argc, char** argv)
{
    using namespace linkpack::sync;

    auto result = parseSyncCommandLine(argc, argv);
    if (result.hasError)
    {
        std::cerr << "linkpack-sync: " << result.errorMessage << "\n";
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

    return runSync(result.options, std::cout, std::cerr);
}
