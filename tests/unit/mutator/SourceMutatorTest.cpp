#include <gtest/gtest.h>

#include "snapshot_store.hpp"
#include "source_mutator.hpp"
#include "trampoline.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace linkpack::mutator
{
namespace
{
    struct ScopedDirectory
    {
        std::filesystem::path path;
        explicit ScopedDirectory(std::filesystem::path directory) : path(std::move(directory)) {}
        ~ScopedDirectory()
        {
            if (!path.empty())
            {
                std::error_code ec;
                std::filesystem::remove_all(path, ec);
            }
        }
    };

    std::filesystem::path makeTemporaryRoot(const std::string& prefix)
    {
        auto root = std::filesystem::temp_directory_path()
            / (prefix + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        std::filesystem::create_directories(root);
        return root;
    }

    void writeText(const std::filesystem::path& path, const std::string& content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream stream(path, std::ios::binary | std::ios::trunc);
        stream << content;
    }

    std::string readText(const std::filesystem::path& path)
    {
        std::ifstream stream(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(stream), std::istreambuf_iterator<char>());
    }

    std::vector<ForcedLinkUnit> planUnits(const std::vector<std::filesystem::path>& paths)
    {
        auto plan = planTrampolines("mylib", paths);
        EXPECT_FALSE(plan.hasError);
        return plan.units;
    }

    bool hasCode(const std::vector<Diagnostic>& diagnostics, const std::string& code)
    {
        for (const auto& diagnostic : diagnostics)
        {
            if (diagnostic.code == code)
            {
                return true;
            }
        }
        return false;
    }

    TEST(SourceMutatorTest, ApplyAppendsBlockAndRestoreIsByteIdentical)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-mutator-roundtrip-")};
        const auto first = cleanup.path / "Sources" / "Init.m";
        const auto second = cleanup.path / "Sources" / "Register.c";
        const std::string firstContent = "@implementation Init\n@end\n";
        const std::string secondContent = "static int registered = 1;";
        writeText(first, firstContent);
        writeText(second, secondContent);

        const auto units = planUnits({first, second});
        const auto stateDirectory = cleanup.path / ".linkpack" / "snapshots";

        MutationTransaction transaction{stateDirectory};
        auto applied = transaction.apply(units);
        ASSERT_FALSE(applied.hasError);
        EXPECT_TRUE(transaction.hasPendingRestores());
        EXPECT_EQ(transaction.mutatedPaths().size(), 2u);

        const auto mutatedFirst = readText(first);
        EXPECT_EQ(mutatedFirst, firstContent + renderTrampolineBlock(units[0].identifier));
        EXPECT_EQ(readText(second), secondContent + "\n" + renderTrampolineBlock(units[1].identifier));
        EXPECT_TRUE(isMutatedCopyOf(mutatedFirst, firstContent));
        EXPECT_FALSE(std::filesystem::is_empty(stateDirectory));

        auto restored = transaction.restore();
        ASSERT_FALSE(restored.hasError);
        EXPECT_FALSE(transaction.hasPendingRestores());
        EXPECT_EQ(readText(first), firstContent);
        EXPECT_EQ(readText(second), secondContent);
        EXPECT_TRUE(std::filesystem::is_empty(stateDirectory));

        EXPECT_EQ(std::distance(std::filesystem::directory_iterator(cleanup.path / "Sources"),
                      std::filesystem::directory_iterator{}),
            2);
    }

    TEST(SourceMutatorTest, RestorePreservesModificationTime)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-mutator-mtime-")};
        const auto unit = cleanup.path / "Init.m";
        writeText(unit, "int init;\n");

        std::filesystem::last_write_time(unit, std::filesystem::last_write_time(unit) - std::chrono::hours(1));
        const auto earlier = std::filesystem::last_write_time(unit);

        MutationTransaction transaction{cleanup.path / "state"};
        ASSERT_FALSE(transaction.apply(planUnits({unit})).hasError);
        ASSERT_FALSE(transaction.restore().hasError);

        EXPECT_EQ(std::filesystem::last_write_time(unit), earlier);
    }

    TEST(SourceMutatorTest, DestructorRestoresPendingUnits)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-mutator-scope-")};
        const auto unit = cleanup.path / "Init.m";
        writeText(unit, "int init;\n");

        {
            MutationTransaction transaction{cleanup.path / "state"};
            ASSERT_FALSE(transaction.apply(planUnits({unit})).hasError);
            EXPECT_NE(readText(unit), "int init;\n");
        }

        EXPECT_EQ(readText(unit), "int init;\n");
    }

    TEST(SourceMutatorTest, ApplyIsAllOrNothingWhenAUnitIsMissing)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-mutator-missing-")};
        const auto present = cleanup.path / "Present.m";
        const auto missing = cleanup.path / "Missing.m";
        writeText(present, "int present;\n");

        MutationTransaction transaction{cleanup.path / "state"};
        auto applied = transaction.apply(planUnits({present, missing}));

        EXPECT_TRUE(applied.hasError);
        EXPECT_TRUE(hasCode(applied.diagnostics, "LPK-E2001"));
        EXPECT_FALSE(transaction.hasPendingRestores());
        EXPECT_EQ(readText(present), "int present;\n");
        EXPECT_FALSE(std::filesystem::exists(cleanup.path / "state"));
    }

    TEST(SourceMutatorTest, RefusesUnitThatAlreadyCarriesABlock)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-mutator-marker-")};
        const auto unit = cleanup.path / "Init.m";
        const auto content = "int init;\n" + renderTrampolineBlock("linkpack_force_old");
        writeText(unit, content);

        MutationTransaction transaction{cleanup.path / "state"};
        auto applied = transaction.apply(planUnits({unit}));

        EXPECT_TRUE(applied.hasError);
        EXPECT_TRUE(hasCode(applied.diagnostics, "LPK-E2007"));
        EXPECT_EQ(readText(unit), content);
    }

    TEST(SourceMutatorTest, SecondApplyWithoutRestoreIsRejected)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-mutator-twice-")};
        const auto unit = cleanup.path / "Init.m";
        writeText(unit, "int init;\n");

        MutationTransaction transaction{cleanup.path / "state"};
        const auto units = planUnits({unit});
        ASSERT_FALSE(transaction.apply(units).hasError);

        auto second = transaction.apply(units);
        EXPECT_TRUE(second.hasError);
        EXPECT_TRUE(hasCode(second.diagnostics, "LPK-E2000"));
    }

    TEST(RecoveryTest, RestoresUnitLeftMutatedByInterruptedRun)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-recovery-restore-")};
        const auto unit = cleanup.path / "Init.m";
        const std::string original = "int init;\n";
        writeText(unit, original);

        SnapshotStore store{cleanup.path / "state"};
        SnapshotRecord record;
        std::string errorMessage;
        ASSERT_TRUE(store.save(unit, original, std::nullopt, record, errorMessage)) << errorMessage;
        writeText(unit, original + renderTrampolineBlock(deriveTrampolineIdentifier("mylib", unit)));

        auto report = recoverInterruptedRun(store);

        EXPECT_FALSE(report.hasError);
        ASSERT_EQ(report.restored.size(), 1u);
        EXPECT_TRUE(hasCode(report.diagnostics, "LPK-W2102"));
        EXPECT_EQ(readText(unit), original);
        EXPECT_FALSE(std::filesystem::exists(record.journalPath));
        EXPECT_FALSE(std::filesystem::exists(record.snapshotPath));
    }

    TEST(RecoveryTest, RestoresUnitWhenEarlierRestoreWasCutShort)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-recovery-partial-")};
        const auto unit = cleanup.path / "Init.m";
        const std::string original = "int init;\nint more;\n";
        writeText(unit, original);

        SnapshotStore store{cleanup.path / "state"};
        SnapshotRecord record;
        std::string errorMessage;
        ASSERT_TRUE(store.save(unit, original, std::nullopt, record, errorMessage)) << errorMessage;
        writeText(unit, original + renderTrampolineBlock(deriveTrampolineIdentifier("mylib", unit)));
        // A restore killed mid-write only ever touches the hidden sibling.
        writeText(cleanup.path / ".Init.m.linkpack-tmp", "int in");

        auto report = recoverInterruptedRun(store);

        EXPECT_FALSE(report.hasError);
        EXPECT_TRUE(hasCode(report.diagnostics, "LPK-W2102"));
        EXPECT_EQ(readText(unit), original);
        EXPECT_FALSE(std::filesystem::exists(cleanup.path / ".Init.m.linkpack-tmp"));
    }

    TEST(RecoveryTest, DiscardsSnapshotOfUnmodifiedUnit)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-recovery-discard-")};
        const auto unit = cleanup.path / "Init.m";
        writeText(unit, "int init;\n");

        SnapshotStore store{cleanup.path / "state"};
        SnapshotRecord record;
        std::string errorMessage;
        ASSERT_TRUE(store.save(unit, "int init;\n", std::nullopt, record, errorMessage));

        auto report = recoverInterruptedRun(store);

        EXPECT_FALSE(report.hasError);
        EXPECT_EQ(report.discarded.size(), 1u);
        EXPECT_TRUE(hasCode(report.diagnostics, "LPK-W2101"));
        EXPECT_FALSE(std::filesystem::exists(record.journalPath));
    }

    TEST(RecoveryTest, KeepsSnapshotWhenUnitWasEditedAfterwards)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-recovery-edited-")};
        const auto unit = cleanup.path / "Init.m";
        writeText(unit, "int init;\n");

        SnapshotStore store{cleanup.path / "state"};
        SnapshotRecord record;
        std::string errorMessage;
        ASSERT_TRUE(store.save(unit, "int init;\n", std::nullopt, record, errorMessage));
        writeText(unit, "int init = 42;\n");

        auto report = recoverInterruptedRun(store);

        EXPECT_TRUE(report.hasError);
        EXPECT_TRUE(hasCode(report.diagnostics, "LPK-E2105"));
        EXPECT_EQ(readText(unit), "int init = 42;\n");
        EXPECT_TRUE(std::filesystem::exists(record.journalPath));
        EXPECT_TRUE(std::filesystem::exists(record.snapshotPath));
    }

    TEST(RecoveryTest, ReportsCorruptSnapshot)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-recovery-corrupt-")};
        const auto unit = cleanup.path / "Init.m";
        writeText(unit, "int init;\n");

        SnapshotStore store{cleanup.path / "state"};
        SnapshotRecord record;
        std::string errorMessage;
        ASSERT_TRUE(store.save(unit, "int init;\n", std::nullopt, record, errorMessage));
        writeText(record.snapshotPath, "int tampered;\n");

        auto report = recoverInterruptedRun(store);

        EXPECT_TRUE(report.hasError);
        EXPECT_TRUE(hasCode(report.diagnostics, "LPK-E2104"));
        EXPECT_EQ(readText(unit), "int init;\n");
    }

    TEST(RecoveryTest, EmptyOrMissingStateDirectoryIsClean)
    {
        ScopedDirectory cleanup{makeTemporaryRoot("linkpack-recovery-empty-")};

        auto report = recoverInterruptedRun(SnapshotStore{cleanup.path / "absent"});
        EXPECT_FALSE(report.hasError);
        EXPECT_TRUE(report.diagnostics.empty());
    }
} // namespace
} // namespace linkpack::mutator
