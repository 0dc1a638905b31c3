#include "diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace linkpack
{
    namespace
    {
        Diagnostic makeDiagnostic(std::string code, std::string message, Severity severity)
        {
            Diagnostic diag;
            diag.code = std::move(code);
            diag.message = std::move(message);
            diag.severity = severity;
            return diag;
        }
    } // namespace

    Diagnostic makeError(std::string code, std::string message)
    {
        return makeDiagnostic(std::move(code), std::move(message), Severity::Error);
    }

    Diagnostic makeWarning(std::string code, std::string message)
    {
        return makeDiagnostic(std::move(code), std::move(message), Severity::Warning);
    }

    bool containsErrors(const std::vector<Diagnostic>& diagnostics)
    {
        return std::any_of(diagnostics.begin(), diagnostics.end(), [](const Diagnostic& diag) {
            return diag.severity == Severity::Error;
        });
    }

    void appendDiagnostics(std::vector<Diagnostic>& target, const std::vector<Diagnostic>& source)
    {
        target.insert(target.end(), source.begin(), source.end());
    }

    void printDiagnostics(std::ostream& stream, const std::vector<Diagnostic>& diagnostics)
    {
        for (const auto& diagnostic : diagnostics)
        {
            stream << diagnostic.code << ' ' << diagnostic.message << '\n';
        }
    }
} // namespace linkpack
