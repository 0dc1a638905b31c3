#include "source_mutator.hpp"

#include "../common/file_io.hpp"

#include <iostream>
#include <string_view>
#include <system_error>
#include <utility>

namespace linkpack::mutator
{
    namespace
    {
        std::optional<std::filesystem::file_time_type> readLastWriteTime(const std::filesystem::path& path)
        {
            std::error_code ec;
            auto time = std::filesystem::last_write_time(path, ec);
            if (ec)
            {
                return std::nullopt;
            }
            return time;
        }

        void applyLastWriteTime(const std::filesystem::path& path,
            const std::optional<std::filesystem::file_time_type>& time)
        {
            if (!time.has_value())
            {
                return;
            }

            std::error_code ec;
            std::filesystem::last_write_time(path, *time, ec);
        }

        std::string composeAppendix(const std::string& original, const std::string& identifier)
        {
            std::string appendix;
            if (!original.empty() && original.back() != '\n')
            {
                appendix.push_back('\n');
            }
            appendix += renderTrampolineBlock(identifier);
            return appendix;
        }
    } // namespace

    bool isMutatedCopyOf(const std::string& current, const std::string& original)
    {
        if (current.size() <= original.size() || current.compare(0, original.size(), original) != 0)
        {
            return false;
        }

        std::string_view tail{current};
        tail.remove_prefix(original.size());
        if (!tail.empty() && tail.front() == '\n')
        {
            tail.remove_prefix(1);
        }

        const std::string_view begin{trampolineBeginMarker};
        const std::string_view end{trampolineEndMarker};
        if (tail.substr(0, begin.size()) != begin)
        {
            return false;
        }

        const auto endPosition = tail.rfind(end);
        return endPosition != std::string_view::npos && endPosition + end.size() + 1 == tail.size();
    }

    MutationTransaction::MutationTransaction(std::filesystem::path stateDirectory)
        : m_store(std::move(stateDirectory))
    {
    }

    MutationTransaction::~MutationTransaction()
    {
        if (m_mutated.empty())
        {
            return;
        }

        auto result = restore();
        if (result.hasError)
        {
            printDiagnostics(std::cerr, result.diagnostics);
        }
    }

    MutationResult MutationTransaction::apply(const std::vector<ForcedLinkUnit>& units)
    {
        MutationResult result;

        if (!m_mutated.empty())
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E2000",
                "mutation transaction already holds mutated units; restore them first."));
            return result;
        }

        for (const auto& unit : units)
        {
            std::error_code statusError;
            const auto status = std::filesystem::status(unit.path, statusError);
            if (statusError || status.type() == std::filesystem::file_type::not_found)
            {
                result.diagnostics.emplace_back(makeError("LPK-E2001",
                    "forced-linkage unit '" + unit.path.string() + "' was not found."));
                continue;
            }

            if (status.type() != std::filesystem::file_type::regular)
            {
                result.diagnostics.emplace_back(makeError("LPK-E2001",
                    "forced-linkage unit '" + unit.path.string() + "' is not a file."));
                continue;
            }

            if (!isWritableFile(unit.path))
            {
                result.diagnostics.emplace_back(makeError("LPK-E2002",
                    "forced-linkage unit '" + unit.path.string() + "' is not writable."));
            }
        }

        if (containsErrors(result.diagnostics))
        {
            result.hasError = true;
            return result;
        }

        std::vector<std::string> originals;
        originals.reserve(units.size());
        for (const auto& unit : units)
        {
            auto content = readFile(unit.path);
            if (!content.has_value())
            {
                result.diagnostics.emplace_back(makeError("LPK-E2006",
                    "unable to read forced-linkage unit '" + unit.path.string() + "'."));
                originals.emplace_back();
                continue;
            }

            if (content->find(trampolineBeginMarker) != std::string::npos)
            {
                result.diagnostics.emplace_back(makeError("LPK-E2007",
                    "forced-linkage unit '" + unit.path.string()
                        + "' already contains a trampoline block; restore it from version control."));
            }
            originals.emplace_back(std::move(*content));
        }

        if (containsErrors(result.diagnostics))
        {
            result.hasError = true;
            return result;
        }

        std::string errorMessage;
        if (!ensureDirectory(m_store.directory(), errorMessage))
        {
            result.hasError = true;
            result.diagnostics.emplace_back(makeError("LPK-E2008", errorMessage));
            return result;
        }

        for (std::size_t index = 0; index < units.size(); ++index)
        {
            const auto& unit = units[index];

            MutatedUnit mutated;
            mutated.unit = unit;
            mutated.original = std::move(originals[index]);

            if (!m_store.save(unit.path, mutated.original, readLastWriteTime(unit.path), mutated.record, errorMessage))
            {
                result.diagnostics.emplace_back(makeError("LPK-E2009",
                    "failed to snapshot '" + unit.path.string() + "': " + errorMessage));
                break;
            }

            // Tracked before the append so a partial write is still rolled back.
            m_mutated.emplace_back(std::move(mutated));
            const auto& tracked = m_mutated.back();

            if (!appendToFile(unit.path, composeAppendix(tracked.original, unit.identifier), errorMessage))
            {
                result.diagnostics.emplace_back(makeError("LPK-E2010",
                    "failed to append trampoline to '" + unit.path.string() + "': " + errorMessage));
                break;
            }
        }

        if (containsErrors(result.diagnostics))
        {
            result.hasError = true;
            auto rollback = restore();
            appendDiagnostics(result.diagnostics, rollback.diagnostics);
        }

        return result;
    }

    MutationResult MutationTransaction::restore()
    {
        MutationResult result;

        for (auto it = m_mutated.rbegin(); it != m_mutated.rend(); ++it)
        {
            std::string errorMessage;
            if (!restoreUnit(*it, errorMessage))
            {
                result.hasError = true;
                result.diagnostics.emplace_back(makeError("LPK-E2011",
                    "failed to restore '" + it->unit.path.string() + "': " + errorMessage
                        + " The original is kept at '" + it->record.snapshotPath.string() + "'."));
            }
        }

        m_mutated.clear();
        return result;
    }

    bool MutationTransaction::hasPendingRestores() const noexcept
    {
        return !m_mutated.empty();
    }

    std::vector<std::filesystem::path> MutationTransaction::mutatedPaths() const
    {
        std::vector<std::filesystem::path> paths;
        paths.reserve(m_mutated.size());
        for (const auto& mutated : m_mutated)
        {
            paths.push_back(mutated.unit.path);
        }
        return paths;
    }

    bool MutationTransaction::restoreUnit(const MutatedUnit& mutated, std::string& errorMessage) const
    {
        if (!replaceFile(mutated.unit.path, mutated.original, errorMessage))
        {
            return false;
        }

        applyLastWriteTime(mutated.unit.path, mutated.record.lastWriteTime);
        return m_store.discard(mutated.record, errorMessage);
    }

    RecoveryReport recoverInterruptedRun(const SnapshotStore& store)
    {
        RecoveryReport report;

        auto records = store.listRecords(report.diagnostics);

        for (const auto& record : records)
        {
            std::string errorMessage;
            auto snapshot = store.load(record, errorMessage);
            if (!snapshot.has_value())
            {
                report.diagnostics.emplace_back(makeError("LPK-E2104",
                    "leftover snapshot for '" + record.unitPath.string() + "' is unusable: " + errorMessage));
                continue;
            }

            auto current = readFile(record.unitPath);
            if (current.has_value() && *current == *snapshot)
            {
                if (!store.discard(record, errorMessage))
                {
                    report.diagnostics.emplace_back(makeError("LPK-E2106", errorMessage));
                    continue;
                }
                report.discarded.push_back(record.unitPath);
                report.diagnostics.emplace_back(makeWarning("LPK-W2101",
                    "discarded leftover snapshot of '" + record.unitPath.string() + "' (unit already unmodified)."));
                continue;
            }

            if (current.has_value() && !isMutatedCopyOf(*current, *snapshot))
            {
                report.diagnostics.emplace_back(makeError("LPK-E2105",
                    "'" + record.unitPath.string() + "' changed after an interrupted run; compare it with '"
                        + record.snapshotPath.string() + "' and remove '" + record.journalPath.string()
                        + "' once resolved."));
                continue;
            }

            if (!replaceFile(record.unitPath, *snapshot, errorMessage))
            {
                report.diagnostics.emplace_back(makeError("LPK-E2106",
                    "failed to restore '" + record.unitPath.string() + "': " + errorMessage));
                continue;
            }
            applyLastWriteTime(record.unitPath, record.lastWriteTime);

            if (!store.discard(record, errorMessage))
            {
                report.diagnostics.emplace_back(makeError("LPK-E2106", errorMessage));
                continue;
            }

            report.restored.push_back(record.unitPath);
            report.diagnostics.emplace_back(makeWarning("LPK-W2102",
                "restored '" + record.unitPath.string() + "' left mutated by an interrupted run."));
        }

        report.hasError = containsErrors(report.diagnostics);
        return report;
    }
} // namespace linkpack::mutator
