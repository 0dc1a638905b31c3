#pragma once

#include "../common/diagnostic.hpp"
#include "snapshot_store.hpp"
#include "trampoline.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace linkpack::mutator
{
    struct MutationResult
    {
        std::vector<Diagnostic> diagnostics;
        bool hasError{false};
    };

    struct RecoveryReport
    {
        std::vector<std::filesystem::path> restored;
        std::vector<std::filesystem::path> discarded;
        std::vector<Diagnostic> diagnostics;
        bool hasError{false};
    };

    // Appends trampolines to forced-linkage units and guarantees their restoration. Either every
    // unit is mutated or none is. Units still mutated when the transaction is destroyed are
    // restored by the destructor.
    class MutationTransaction
    {
    public:
        explicit MutationTransaction(std::filesystem::path stateDirectory);
        ~MutationTransaction();

        MutationTransaction(const MutationTransaction&) = delete;
        MutationTransaction& operator=(const MutationTransaction&) = delete;

        MutationResult apply(const std::vector<ForcedLinkUnit>& units);
        MutationResult restore();

        [[nodiscard]] bool hasPendingRestores() const noexcept;
        [[nodiscard]] std::vector<std::filesystem::path> mutatedPaths() const;

    private:
        struct MutatedUnit
        {
            ForcedLinkUnit unit;
            SnapshotRecord record;
            std::string original;
        };

        bool restoreUnit(const MutatedUnit& mutated, std::string& errorMessage) const;

        SnapshotStore m_store;
        std::vector<MutatedUnit> m_mutated;
    };

    // Resolves snapshots left by a run that was killed between mutation and restoration.
    RecoveryReport recoverInterruptedRun(const SnapshotStore& store);

    // True when `current` is `original` followed by one appended trampoline block.
    [[nodiscard]] bool isMutatedCopyOf(const std::string& current, const std::string& original);
} // namespace linkpack::mutator
