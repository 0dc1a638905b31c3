#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace linkpack
{
    enum class Severity
    {
        Error,
        Warning
    };

    struct Diagnostic
    {
        std::string code;
        std::string message;
        Severity severity{Severity::Error};
    };

    Diagnostic makeError(std::string code, std::string message);
    Diagnostic makeWarning(std::string code, std::string message);

    [[nodiscard]] bool containsErrors(const std::vector<Diagnostic>& diagnostics);

    void appendDiagnostics(std::vector<Diagnostic>& target, const std::vector<Diagnostic>& source);

    // Writes one "<code> <message>" line per diagnostic.
    void printDiagnostics(std::ostream& stream, const std::vector<Diagnostic>& diagnostics);
} // namespace linkpack
