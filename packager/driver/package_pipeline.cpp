#include "package_pipeline.hpp"

#include "../assembler/file_classifier.hpp"
#include "../assembler/package_assembler.hpp"
#include "../assembler/resource_naming.hpp"
#include "../bootstrap/bootstrap_emitter.hpp"
#include "../build/build_invocation.hpp"
#include "../combiner/multi_arch_combiner.hpp"
#include "../common/file_io.hpp"
#include "../common/package_identity.hpp"
#include "../common/repository.hpp"
#include "../config/list_file.hpp"
#include "../mutator/source_mutator.hpp"
#include "../mutator/trampoline.hpp"
#include "interrupt_guard.hpp"

#include <optional>
#include <string>
#include <system_error>
#include <utility>

namespace linkpack::driver
{
    namespace
    {
        class PackagePipeline
        {
        public:
            PackagePipeline(const PackageOptions& options, ToolRunner& runner, std::ostream& out, std::ostream& err)
                : m_options(options)
                , m_runner(runner)
                , m_out(out)
                , m_err(err)
            {
                m_descriptor.name = options.packageName;
                m_descriptor.versionTag = options.versionTag;
                m_descriptor.configuration = options.configuration;
                m_descriptor.architectures = normalizeArchitectures(options.architectures);
            }

            PipelineResult run()
            {
                if (!prepare())
                {
                    return finish(1);
                }

                if (m_options.dryRun)
                {
                    printPlan();
                    return finish(0);
                }

                if (!checkEnvironment() || !recover())
                {
                    return finish(1);
                }

                if (assembler::embedsBinary(m_options.embedMode) && !buildUniversalBinary())
                {
                    return finish(m_result.exitCode != 0 ? m_result.exitCode : 1);
                }

                if (!assemble())
                {
                    return finish(1);
                }

                return finish(0);
            }

        private:
            void notice(const std::string& message)
            {
                m_out << "[notice] " << message << "\n";
            }

            void report(const std::vector<Diagnostic>& diagnostics)
            {
                printDiagnostics(m_err, diagnostics);
                appendDiagnostics(m_result.diagnostics, diagnostics);
            }

            void report(Diagnostic diagnostic)
            {
                report(std::vector<Diagnostic>{std::move(diagnostic)});
            }

            PipelineResult finish(int exitCode)
            {
                m_result.exitCode = exitCode;
                return std::move(m_result);
            }

            bool prepare()
            {
                std::string errorMessage;
                if (!validateDescriptor(m_descriptor, errorMessage))
                {
                    report(makeError("LPK-E1004", errorMessage));
                    return false;
                }

                std::error_code statusError;
                if (!std::filesystem::is_directory(m_options.projectRoot, statusError) || statusError)
                {
                    report(makeError("LPK-E1006",
                        "project root '" + m_options.projectRoot.string() + "' is not a directory."));
                    return false;
                }

                auto repository = resolveRepositoryRoot(m_options.repositoryRoot);
                if (repository.hasError)
                {
                    report(makeError("LPK-E1005", repository.errorMessage));
                    return false;
                }
                m_repositoryRoot = repository.path;

                if (!loadHeaders() || !loadForcedLinkUnits() || !checkResources())
                {
                    return false;
                }

                if (!assembler::embedsBinary(m_options.embedMode))
                {
                    return true;
                }

                build::BuildRequest request;
                request.packageName = m_descriptor.name;
                request.configuration = m_descriptor.configuration;
                request.architectures = m_descriptor.architectures;
                request.projectRoot = m_options.projectRoot;
                request.buildRoot = m_options.buildRoot;
                request.minimumVersion = m_options.minimumVersion;
                request.builderExecutable = m_options.builderExecutable;
                request.builderArguments = m_options.builderArguments;

                auto plan = build::planArchitectureBuilds(request);
                if (plan.hasError)
                {
                    report(makeError("LPK-E1007", plan.errorMessage));
                    return false;
                }

                m_builds = std::move(plan.builds);
                return true;
            }

            bool loadHeaders()
            {
                auto list = config::readListFile(m_options.headerListPath);
                if (list.hasError)
                {
                    report(makeError("LPK-E1002", list.errorMessage));
                    return false;
                }

                if (!list.found)
                {
                    report(makeError("LPK-E1003",
                        "public header list '" + m_options.headerListPath.string() + "' not found."));
                    return false;
                }

                m_headers = config::resolveListPaths(list.entries, m_options.projectRoot);

                bool allPresent = true;
                for (const auto& header : m_headers)
                {
                    std::error_code statusError;
                    if (!std::filesystem::is_regular_file(header, statusError) || statusError)
                    {
                        report(makeError("LPK-E4001", "public header '" + header.string() + "' does not exist."));
                        allPresent = false;
                    }
                }

                return allPresent;
            }

            bool loadForcedLinkUnits()
            {
                auto list = config::readListFile(m_options.forcedLinkListPath);
                if (list.hasError)
                {
                    report(makeError("LPK-E1002", list.errorMessage));
                    return false;
                }

                if (!list.found)
                {
                    if (m_options.forcedLinkListExplicit)
                    {
                        report(makeError("LPK-E1003",
                            "forced-linkage list '" + m_options.forcedLinkListPath.string() + "' not found."));
                        return false;
                    }
                    return true;
                }

                if (list.entries.empty())
                {
                    return true;
                }

                if (!assembler::embedsBinary(m_options.embedMode))
                {
                    notice("forced-linkage list ignored: embed mode '" + std::string{assembler::toString(m_options.embedMode)}
                        + "' produces no binary.");
                    return true;
                }

                auto plan = mutator::planTrampolines(m_descriptor.name,
                    config::resolveListPaths(list.entries, m_options.projectRoot));
                report(plan.diagnostics);
                if (plan.hasError)
                {
                    return false;
                }

                m_units = std::move(plan.units);
                return true;
            }

            // Paths inside the project that belong to linkpack rather than to the package.
            std::vector<std::filesystem::path> excludedProjectPaths() const
            {
                return {m_options.buildRoot,
                    m_options.stateDirectory,
                    m_repositoryRoot,
                    m_options.headerListPath,
                    m_options.forcedLinkListPath};
            }

            // A rejecting resource policy must fail before any unit is mutated or built.
            bool checkResources()
            {
                if (m_options.resourcePolicy != assembler::ResourcePolicy::Reject)
                {
                    return true;
                }

                auto projectFiles = assembler::collectProjectFiles(m_options.projectRoot, excludedProjectPaths());
                auto diagnostics = std::move(projectFiles.diagnostics);
                appendDiagnostics(diagnostics,
                    assembler::checkResourceNames(m_descriptor.name,
                        assembler::AssemblyRequest{}.resourcePrefixSeparator,
                        projectFiles.resources,
                        m_options.resourcePolicy));

                if (!containsErrors(diagnostics))
                {
                    return true;
                }

                report(diagnostics);
                return false;
            }

            void printPlan()
            {
                const auto directoryName = packageDirectoryName(m_descriptor);
                notice("package: " + directoryName + " -> " + (m_repositoryRoot / directoryName).string());
                notice(std::string{"embed: "} + assembler::toString(m_options.embedMode));

                for (const auto& header : m_headers)
                {
                    notice("header: " + header.string());
                }

                for (const auto& unit : m_units)
                {
                    notice("forced linkage: " + unit.path.string() + " (" + unit.identifier + ")");
                }

                for (const auto& build : m_builds)
                {
                    notice("build " + build.architecture + " -> " + build.expectedBinary.string());
                    printInvocation(m_out, build.invocation);
                }

                if (!m_builds.empty())
                {
                    notice("combine -> " + universalBinaryPath(m_options).string());
                }

                notice("dry run: nothing was modified.");
            }

            bool checkEnvironment()
            {
                std::string errorMessage;
                if (!ensureDirectory(m_repositoryRoot, errorMessage)
                    || !probeWritableDirectory(m_repositoryRoot, errorMessage))
                {
                    report(makeError("LPK-E4004", errorMessage));
                    return false;
                }

                if (assembler::embedsBinary(m_options.embedMode) && !ensureDirectory(m_options.buildRoot, errorMessage))
                {
                    report(makeError("LPK-E3002", errorMessage));
                    return false;
                }

                return true;
            }

            bool recover()
            {
                mutator::SnapshotStore store{m_options.stateDirectory};
                auto recovery = mutator::recoverInterruptedRun(store);
                report(recovery.diagnostics);

                for (const auto& path : recovery.restored)
                {
                    notice("restored " + path.string() + " from an interrupted run.");
                }

                return !recovery.hasError;
            }

            bool interrupted()
            {
                const int signal = InterruptGuard::pendingSignal();
                if (signal == 0)
                {
                    return false;
                }

                m_result.exitCode = 128 + signal;
                return true;
            }

            // Restores explicitly so failures surface as diagnostics rather than from the destructor.
            void abandon(mutator::MutationTransaction& transaction)
            {
                if (transaction.hasPendingRestores())
                {
                    auto restored = transaction.restore();
                    report(restored.diagnostics);
                }

                if (m_result.exitCode > 128)
                {
                    report(makeError("LPK-E1008",
                        "interrupted by signal " + std::to_string(m_result.exitCode - 128) + "."));
                }
            }

            bool buildUniversalBinary()
            {
                mutator::MutationTransaction transaction{m_options.stateDirectory};
                InterruptGuard guard;

                if (!m_units.empty())
                {
                    auto applied = transaction.apply(m_units);
                    report(applied.diagnostics);
                    if (applied.hasError)
                    {
                        return false;
                    }
                    notice("appended trampolines to " + std::to_string(m_units.size()) + " forced-linkage unit(s).");
                }

                for (const auto& build : m_builds)
                {
                    if (interrupted())
                    {
                        abandon(transaction);
                        return false;
                    }

                    notice("building " + build.architecture + ".");
                    if (m_options.verbose)
                    {
                        printInvocation(m_out, build.invocation);
                    }

                    auto built = build::runArchitectureBuild(build, m_runner);
                    report(built.diagnostics);
                    if (interrupted() || built.hasError)
                    {
                        abandon(transaction);
                        return false;
                    }
                }

                auto restored = transaction.restore();
                report(restored.diagnostics);
                if (restored.hasError)
                {
                    return false;
                }

                if (!m_units.empty())
                {
                    notice("restored " + std::to_string(m_units.size()) + " forced-linkage unit(s).");
                }

                if (interrupted())
                {
                    abandon(transaction);
                    return false;
                }

                combiner::CombineRequest request;
                request.outputPath = universalBinaryPath(m_options);
                request.combinerExecutable = m_options.combinerExecutable;
                for (const auto& build : m_builds)
                {
                    request.slices.push_back({build.architecture, build.expectedBinary});
                }

                notice("combining " + std::to_string(request.slices.size()) + " architecture(s) into "
                    + request.outputPath.string() + ".");

                if (m_options.verbose)
                {
                    auto plan = combiner::planCombine(request);
                    if (!plan.hasError)
                    {
                        printInvocation(m_out, plan.invocation);
                    }
                }

                auto combined = combiner::combine(request, m_runner);
                report(combined.diagnostics);
                if (interrupted())
                {
                    abandon(transaction);
                    return false;
                }

                if (combined.hasError)
                {
                    return false;
                }

                m_result.universalBinary = combined.universalBinary;
                return true;
            }

            bool assemble()
            {
                assembler::AssemblyRequest request;
                request.descriptor = m_descriptor;
                request.projectRoot = m_options.projectRoot;
                request.repositoryRoot = m_repositoryRoot;
                request.publicHeaders = m_headers;
                request.universalBinary = m_result.universalBinary;
                request.embedMode = m_options.embedMode;
                request.resourcePolicy = m_options.resourcePolicy;
                request.excludedPaths = excludedProjectPaths();

                if (m_options.embedMode == assembler::EmbedMode::Binary && !m_units.empty())
                {
                    request.bootstrapUnit = bootstrap::renderBootstrapUnit(m_descriptor.name, m_units);
                }

                auto assembled = assembler::assemblePackage(request);
                report(assembled.diagnostics);
                if (assembled.hasError)
                {
                    return false;
                }

                m_result.packagePath = assembled.packagePath;
                notice("package written to " + assembled.packagePath.string() + ".");
                return true;
            }

            const PackageOptions& m_options;
            ToolRunner& m_runner;
            std::ostream& m_out;
            std::ostream& m_err;
            PackageDescriptor m_descriptor;
            std::filesystem::path m_repositoryRoot;
            std::vector<std::filesystem::path> m_headers;
            std::vector<mutator::ForcedLinkUnit> m_units;
            std::vector<build::ArchitectureBuild> m_builds;
            PipelineResult m_result;
        };
    } // namespace

    std::filesystem::path universalBinaryPath(const PackageOptions& options)
    {
        return build::expectedArchitectureBinary(options.buildRoot, options.configuration, "universal", options.packageName);
    }

    PipelineResult runPackagePipeline(const PackageOptions& options,
        ToolRunner& runner,
        std::ostream& out,
        std::ostream& err)
    {
        PackagePipeline pipeline{options, runner, out, err};
        return pipeline.run();
    }
} // namespace linkpack::driver
