#include "snapshot_store.hpp"

#include "../common/checksum.hpp"
#include "../common/file_io.hpp"
#include "../config/list_file.hpp"

#include <algorithm>
#include <sstream>
#include <system_error>
#include <utility>

namespace linkpack::mutator
{
    namespace
    {
        constexpr const char* journalExtension = ".journal";
        constexpr const char* snapshotExtension = ".snapshot";

        std::optional<std::uint64_t> parseUnsigned(const std::string& value, int base)
        {
            if (value.empty())
            {
                return std::nullopt;
            }

            std::uint64_t result = 0;
            for (char ch : value)
            {
                unsigned digit = 0;
                if (ch >= '0' && ch <= '9')
                {
                    digit = static_cast<unsigned>(ch - '0');
                }
                else if (base == 16 && ch >= 'a' && ch <= 'f')
                {
                    digit = static_cast<unsigned>(ch - 'a' + 10);
                }
                else
                {
                    return std::nullopt;
                }
                result = result * static_cast<std::uint64_t>(base) + digit;
            }
            return result;
        }

        std::optional<long long> parseSigned(const std::string& value)
        {
            if (!value.empty() && value.front() == '-')
            {
                auto magnitude = parseUnsigned(value.substr(1), 10);
                if (!magnitude.has_value())
                {
                    return std::nullopt;
                }
                return -static_cast<long long>(*magnitude);
            }

            auto magnitude = parseUnsigned(value, 10);
            if (!magnitude.has_value())
            {
                return std::nullopt;
            }
            return static_cast<long long>(*magnitude);
        }
    } // namespace

    SnapshotStore::SnapshotStore(std::filesystem::path directory)
        : m_directory(std::move(directory))
    {
    }

    const std::filesystem::path& SnapshotStore::directory() const noexcept
    {
        return m_directory;
    }

    std::string SnapshotStore::keyFor(const std::filesystem::path& unitPath) const
    {
        return toHex(checksum64(unitPath.lexically_normal().string()));
    }

    bool SnapshotStore::save(const std::filesystem::path& unitPath,
        const std::string& content,
        const std::optional<std::filesystem::file_time_type>& lastWriteTime,
        SnapshotRecord& record,
        std::string& errorMessage) const
    {
        const std::string key = keyFor(unitPath);

        record = SnapshotRecord{};
        record.unitPath = unitPath.lexically_normal();
        record.checksum = checksum64(content);
        record.size = content.size();
        record.lastWriteTime = lastWriteTime;
        record.snapshotPath = m_directory / (key + snapshotExtension);
        record.journalPath = m_directory / (key + journalExtension);

        if (!writeFile(record.snapshotPath, content, errorMessage))
        {
            return false;
        }

        std::ostringstream journal;
        journal << "path=" << record.unitPath.string() << '\n';
        journal << "checksum=" << toHex(record.checksum) << '\n';
        journal << "size=" << record.size << '\n';
        if (lastWriteTime.has_value())
        {
            journal << "mtime=" << lastWriteTime->time_since_epoch().count() << '\n';
        }

        if (!replaceFile(record.journalPath, journal.str(), errorMessage))
        {
            std::error_code removeError;
            std::filesystem::remove(record.snapshotPath, removeError);
            return false;
        }

        return true;
    }

    std::optional<std::string> SnapshotStore::load(const SnapshotRecord& record, std::string& errorMessage) const
    {
        auto content = readFile(record.snapshotPath);
        if (!content.has_value())
        {
            errorMessage = "snapshot '" + record.snapshotPath.string() + "' is missing or unreadable.";
            return std::nullopt;
        }

        if (content->size() != record.size || checksum64(*content) != record.checksum)
        {
            errorMessage = "snapshot '" + record.snapshotPath.string() + "' does not match its journal checksum.";
            return std::nullopt;
        }

        return content;
    }

    bool SnapshotStore::discard(const SnapshotRecord& record, std::string& errorMessage) const
    {
        // Journal first: a snapshot without a journal is treated as an orphan.
        std::error_code journalError;
        std::filesystem::remove(record.journalPath, journalError);
        if (journalError)
        {
            errorMessage = "failed to remove journal '" + record.journalPath.string() + "': " + journalError.message();
            return false;
        }

        std::error_code snapshotError;
        std::filesystem::remove(record.snapshotPath, snapshotError);
        if (snapshotError)
        {
            errorMessage = "failed to remove snapshot '" + record.snapshotPath.string() + "': " + snapshotError.message();
            return false;
        }

        return true;
    }

    std::vector<SnapshotRecord> SnapshotStore::listRecords(std::vector<Diagnostic>& diagnostics) const
    {
        std::vector<SnapshotRecord> records;

        std::error_code statusError;
        if (!std::filesystem::is_directory(m_directory, statusError) || statusError)
        {
            return records;
        }

        std::vector<std::filesystem::path> journals;
        std::vector<std::filesystem::path> snapshots;

        std::error_code iteratorError;
        std::filesystem::directory_iterator it(m_directory, iteratorError);
        if (iteratorError)
        {
            diagnostics.emplace_back(makeError("LPK-E2103",
                "failed to enumerate snapshot directory '" + m_directory.string() + "': " + iteratorError.message()));
            return records;
        }

        for (const auto& entry : it)
        {
            const auto extension = entry.path().extension();
            if (extension == journalExtension)
            {
                journals.push_back(entry.path());
            }
            else if (extension == snapshotExtension)
            {
                snapshots.push_back(entry.path());
            }
        }

        std::sort(journals.begin(), journals.end());

        for (const auto& snapshotPath : snapshots)
        {
            auto journalPath = snapshotPath;
            journalPath.replace_extension(journalExtension);
            if (std::find(journals.begin(), journals.end(), journalPath) == journals.end())
            {
                std::error_code removeError;
                std::filesystem::remove(snapshotPath, removeError);
                if (removeError)
                {
                    diagnostics.emplace_back(makeWarning("LPK-W2103",
                        "failed to remove orphan snapshot '" + snapshotPath.string() + "': " + removeError.message()));
                }
            }
        }

        for (const auto& journalPath : journals)
        {
            auto record = readJournal(journalPath, diagnostics);
            if (record.has_value())
            {
                records.emplace_back(std::move(*record));
            }
        }

        return records;
    }

    std::optional<SnapshotRecord> SnapshotStore::readJournal(const std::filesystem::path& journalPath,
        std::vector<Diagnostic>& diagnostics) const
    {
        auto content = readFile(journalPath);
        if (!content.has_value())
        {
            diagnostics.emplace_back(makeError("LPK-E2104", "unable to read journal '" + journalPath.string() + "'."));
            return std::nullopt;
        }

        SnapshotRecord record;
        record.journalPath = journalPath;
        record.snapshotPath = journalPath;
        record.snapshotPath.replace_extension(snapshotExtension);

        bool hasChecksum = false;
        bool hasSize = false;

        for (const auto& entry : config::parseListContent(*content))
        {
            const auto separator = entry.value.find('=');
            if (separator == std::string::npos)
            {
                continue;
            }

            const std::string key = entry.value.substr(0, separator);
            const std::string value = entry.value.substr(separator + 1);

            if (key == "path")
            {
                record.unitPath = std::filesystem::path{value};
            }
            else if (key == "checksum")
            {
                auto parsed = parseUnsigned(value, 16);
                if (parsed.has_value())
                {
                    record.checksum = *parsed;
                    hasChecksum = true;
                }
            }
            else if (key == "size")
            {
                auto parsed = parseUnsigned(value, 10);
                if (parsed.has_value())
                {
                    record.size = static_cast<std::uintmax_t>(*parsed);
                    hasSize = true;
                }
            }
            else if (key == "mtime")
            {
                auto parsed = parseSigned(value);
                if (parsed.has_value())
                {
                    record.lastWriteTime = std::filesystem::file_time_type{
                        std::filesystem::file_time_type::duration{*parsed}};
                }
            }
        }

        if (record.unitPath.empty() || !hasChecksum || !hasSize)
        {
            diagnostics.emplace_back(makeError("LPK-E2104",
                "journal '" + journalPath.string() + "' is incomplete; inspect it and its snapshot manually."));
            return std::nullopt;
        }

        return record;
    }
} // namespace linkpack::mutator
