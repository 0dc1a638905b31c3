#pragma once

#include "../common/diagnostic.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace linkpack::mutator
{
    struct SnapshotRecord
    {
        std::filesystem::path unitPath;
        std::uint64_t checksum{0};
        std::uintmax_t size{0};
        std::optional<std::filesystem::file_time_type> lastWriteTime;
        std::filesystem::path journalPath;
        std::filesystem::path snapshotPath;
    };

    // Pre-mutation copies of forced-linkage units, keyed by absolute path. A journal is
    // written only after its snapshot is complete, so a journal always names a usable copy.
    class SnapshotStore
    {
    public:
        explicit SnapshotStore(std::filesystem::path directory);

        [[nodiscard]] const std::filesystem::path& directory() const noexcept;
        [[nodiscard]] std::string keyFor(const std::filesystem::path& unitPath) const;

        bool save(const std::filesystem::path& unitPath,
            const std::string& content,
            const std::optional<std::filesystem::file_time_type>& lastWriteTime,
            SnapshotRecord& record,
            std::string& errorMessage) const;

        // Fails when the stored bytes no longer match the journal checksum.
        std::optional<std::string> load(const SnapshotRecord& record, std::string& errorMessage) const;

        bool discard(const SnapshotRecord& record, std::string& errorMessage) const;

        // Journals left behind by earlier runs. Orphan snapshots without a journal are removed.
        std::vector<SnapshotRecord> listRecords(std::vector<Diagnostic>& diagnostics) const;

    private:
        std::optional<SnapshotRecord> readJournal(const std::filesystem::path& journalPath,
            std::vector<Diagnostic>& diagnostics) const;

        std::filesystem::path m_directory;
    };
} // namespace linkpack::mutator
