#include "sync_runner.hpp"

#include "../common/diagnostic.hpp"
#include "../common/repository.hpp"
#include "../config/list_file.hpp"
#include "reference_synchronizer.hpp"

#include <string>
#include <utility>

namespace linkpack::sync
{
    int runSync(const SyncOptions& options, std::ostream& out, std::ostream& err)
    {
        auto repository = resolveRepositoryRoot(options.repositoryRoot);
        if (repository.hasError)
        {
            err << "LPK-E5002 " << repository.errorMessage << "\n";
            return 1;
        }

        auto list = config::readListFile(options.dependencyListPath);
        if (list.hasError)
        {
            err << "LPK-E1002 " << list.errorMessage << "\n";
            return 1;
        }

        if (!list.found)
        {
            err << "LPK-E1003 dependency list '" << options.dependencyListPath.string() << "' not found.\n";
            return 1;
        }

        auto parsed = config::parseDependencyDeclarations(list.entries, options.dependencyListPath);
        printDiagnostics(err, parsed.diagnostics);

        out << "[notice] repository: " << repository.path.string() << "\n";
        out << "[notice] workspace: " << options.workspaceRoot.string() << "\n";
        out << "[notice] configuration: " << options.configuration << "\n";

        SyncRequest request;
        request.workspaceRoot = options.workspaceRoot;
        request.repositoryRoot = repository.path;
        request.configuration = options.configuration;
        request.declarations = std::move(parsed.declarations);

        auto result = synchronizeReferences(request);

        for (const auto& change : result.changes)
        {
            if (change.action == ReferenceAction::Unchanged && !options.verbose)
            {
                continue;
            }

            out << "[notice] " << toString(change.action) << ": " << change.name;
            if (!change.target.empty())
            {
                out << " -> " << change.target.string();
            }
            out << "\n";
        }

        printDiagnostics(err, result.diagnostics);

        if (result.hasError)
        {
            return 1;
        }

        if (options.strict && result.unresolvedCount > 0)
        {
            err << "linkpack-sync: " << result.unresolvedCount
                      << " dependency declaration(s) did not resolve (--strict).\n";
            return 1;
        }

        out << "[notice] " << result.referenceDirectory.string() << " is up to date.\n";
        return 0;
    }
} // namespace linkpack::sync
