#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "harbor/core/ids.h"
#include "harbor/core/time.h"
#include "harbor/metadata/sqlite_metadata_store.h"

namespace {

using harbor::core::ErrorCode;
using harbor::metadata::FileRecord;
using harbor::metadata::SqliteMetadataStore;
using harbor::metadata::StagingFile;

std::filesystem::path MakeTempDbPath() {
    const auto name = "harbor_test_" + Poco::UUIDGenerator().createOne().toString() + ".db";
    return std::filesystem::temp_directory_path() / name;
}

StagingFile NewStagingFile(const std::string& name, const std::string& staged_at = "") {
    StagingFile file;
    file.id = harbor::core::GenerateObjectId();
    file.name = name;
    file.staged_at = staged_at;
    return file;
}

std::string StaleBefore() { return harbor::core::NowIso8601WithOffsetSeconds(-600); }

std::string HoursAgo(int hours) {
    return harbor::core::NowIso8601WithOffsetSeconds(-static_cast<long long>(hours) * 3600);
}

}  // namespace

TEST(MetadataStore, CreateAndFetchStagingFile) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto input = NewStagingFile("report.pdf");
        input.mime = "application/pdf";
        input.size_bytes = 99;

        auto created = store.CreateStagingFile(input);
        ASSERT_TRUE(created.ok());
        EXPECT_EQ(created.value().size_bytes, 0u);
        EXPECT_FALSE(created.value().staged_at.empty());

        auto fetched = store.GetStagingFile(input.id);
        ASSERT_TRUE(fetched.ok());
        EXPECT_EQ(fetched.value().name, "report.pdf");
        ASSERT_TRUE(fetched.value().mime.has_value());
        EXPECT_EQ(*fetched.value().mime, "application/pdf");

        auto duplicate = store.CreateStagingFile(input);
        ASSERT_FALSE(duplicate.ok());
        EXPECT_EQ(duplicate.error().code, ErrorCode::kAlreadyExists);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, MissingMimeStaysNull) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto input = NewStagingFile("notes");
        ASSERT_TRUE(store.CreateStagingFile(input).ok());

        auto fetched = store.GetStagingFile(input.id);
        ASSERT_TRUE(fetched.ok());
        EXPECT_FALSE(fetched.value().mime.has_value());

        auto missing = store.GetStagingFile(harbor::core::GenerateObjectId());
        ASSERT_FALSE(missing.ok());
        EXPECT_EQ(missing.error().code, ErrorCode::kNotFound);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, LeaseExcludesOtherTokens) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto input = NewStagingFile("a.bin");
        ASSERT_TRUE(store.CreateStagingFile(input).ok());

        ASSERT_TRUE(store.LockStagingFile(input.id, "first", StaleBefore()).ok());
        // Re-entrant for the same token.
        ASSERT_TRUE(store.LockStagingFile(input.id, "first", StaleBefore()).ok());

        auto second = store.LockStagingFile(input.id, "second", StaleBefore());
        ASSERT_FALSE(second.ok());
        EXPECT_EQ(second.error().code, ErrorCode::kConflict);

        auto lost = store.UpdateStagingFileSize(input.id, "second", 10);
        ASSERT_FALSE(lost.ok());
        EXPECT_EQ(lost.error().code, ErrorCode::kConflict);

        auto updated = store.UpdateStagingFileSize(input.id, "first", 10);
        ASSERT_TRUE(updated.ok());
        EXPECT_EQ(updated.value().size_bytes, 10u);

        ASSERT_TRUE(store.UnlockStagingFile(input.id, "first").ok());
        EXPECT_TRUE(store.LockStagingFile(input.id, "second", StaleBefore()).ok());

        auto missing = store.LockStagingFile(harbor::core::GenerateObjectId(), "x", StaleBefore());
        ASSERT_FALSE(missing.ok());
        EXPECT_EQ(missing.error().code, ErrorCode::kNotFound);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, StaleLeaseIsTakenOver) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto input = NewStagingFile("a.bin");
        ASSERT_TRUE(store.CreateStagingFile(input).ok());
        ASSERT_TRUE(store.LockStagingFile(input.id, "crashed", StaleBefore()).ok());

        // Every lease taken before "one hour from now" counts as stale.
        const auto future = harbor::core::NowIso8601WithOffsetSeconds(3600);
        EXPECT_TRUE(store.LockStagingFile(input.id, "rescuer", future).ok());
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, ExpiryRespectsAgeOrderAndLimit) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto oldest = NewStagingFile("3h", HoursAgo(3));
        auto middle = NewStagingFile("2h", HoursAgo(2));
        auto newest = NewStagingFile("1h", HoursAgo(1));
        // Insert out of age order to make sure ordering comes from staged_at.
        ASSERT_TRUE(store.CreateStagingFile(middle).ok());
        ASSERT_TRUE(store.CreateStagingFile(newest).ok());
        ASSERT_TRUE(store.CreateStagingFile(oldest).ok());

        const auto cutoff = harbor::core::NowIso8601WithOffsetSeconds(-90 * 60);
        auto first = store.DeleteExpiredStagingFiles(cutoff, StaleBefore(), 1);
        ASSERT_TRUE(first.ok());
        ASSERT_EQ(first.value().size(), 1u);
        EXPECT_EQ(first.value()[0], oldest.id);
        EXPECT_FALSE(store.GetStagingFile(oldest.id).ok());
        EXPECT_TRUE(store.GetStagingFile(middle.id).ok());

        auto rest = store.DeleteExpiredStagingFiles(cutoff, StaleBefore(), 10);
        ASSERT_TRUE(rest.ok());
        ASSERT_EQ(rest.value().size(), 1u);
        EXPECT_EQ(rest.value()[0], middle.id);
        EXPECT_TRUE(store.GetStagingFile(newest.id).ok());
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, ExpiryDeletesExactlyTheReturnedRows) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        // Equal ages leave the order among them to the database.
        const auto staged_at = HoursAgo(3);
        std::vector<StagingFile> files = {NewStagingFile("a", staged_at),
                                          NewStagingFile("b", staged_at),
                                          NewStagingFile("c", staged_at)};
        for (const auto& file : files) {
            ASSERT_TRUE(store.CreateStagingFile(file).ok());
        }

        const auto cutoff = harbor::core::NowIso8601WithOffsetSeconds(-3600);
        auto expired = store.DeleteExpiredStagingFiles(cutoff, StaleBefore(), 2);
        ASSERT_TRUE(expired.ok());
        ASSERT_EQ(expired.value().size(), 2u);

        int remaining = 0;
        for (const auto& file : files) {
            const bool returned = std::find(expired.value().begin(), expired.value().end(),
                                            file.id) != expired.value().end();
            const bool present = store.GetStagingFile(file.id).ok();
            EXPECT_NE(returned, present) << file.name;
            if (present) {
                ++remaining;
            }
        }
        EXPECT_EQ(remaining, 1);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, ExpirySkipsLiveLeases) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto busy = NewStagingFile("busy", HoursAgo(5));
        ASSERT_TRUE(store.CreateStagingFile(busy).ok());
        ASSERT_TRUE(store.LockStagingFile(busy.id, "writer", StaleBefore()).ok());

        auto expired = store.DeleteExpiredStagingFiles(HoursAgo(1), StaleBefore(), 10);
        ASSERT_TRUE(expired.ok());
        EXPECT_TRUE(expired.value().empty());
        EXPECT_TRUE(store.GetStagingFile(busy.id).ok());
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, PromoteReplacesStagingRow) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto input = NewStagingFile("photo.png");
        ASSERT_TRUE(store.CreateStagingFile(input).ok());
        ASSERT_TRUE(store.LockStagingFile(input.id, "tok", StaleBefore()).ok());

        FileRecord file;
        file.id = input.id;
        file.name = input.name;
        file.mime = "image/png";
        file.size_bytes = 4;
        file.hash = "abcd";

        bool moved = false;
        auto promoted = store.PromoteStagingFile("tok", file, [&moved]() {
            moved = true;
            return harbor::core::Ok();
        });
        ASSERT_TRUE(promoted.ok());
        EXPECT_TRUE(moved);
        EXPECT_FALSE(promoted.value().created_at.empty());

        EXPECT_FALSE(store.GetStagingFile(input.id).ok());
        auto fetched = store.GetFile(input.id);
        ASSERT_TRUE(fetched.ok());
        EXPECT_EQ(fetched.value().mime, "image/png");
        EXPECT_EQ(fetched.value().size_bytes, 4u);
        EXPECT_EQ(fetched.value().hash, "abcd");
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, FailedMoveRollsBackPromotion) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto input = NewStagingFile("photo.png");
        ASSERT_TRUE(store.CreateStagingFile(input).ok());
        ASSERT_TRUE(store.LockStagingFile(input.id, "tok", StaleBefore()).ok());

        FileRecord file;
        file.id = input.id;
        file.name = input.name;
        file.mime = "image/png";
        file.hash = "abcd";

        auto promoted = store.PromoteStagingFile("tok", file, []() -> harbor::core::Result<void> {
            return harbor::core::Error{ErrorCode::kIoError, "disk full"};
        });
        ASSERT_FALSE(promoted.ok());
        EXPECT_EQ(promoted.error().code, ErrorCode::kIoError);

        EXPECT_TRUE(store.GetStagingFile(input.id).ok());
        auto resident = store.GetFile(input.id);
        ASSERT_FALSE(resident.ok());
        EXPECT_EQ(resident.error().code, ErrorCode::kNotFound);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, PromoteRequiresLease) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto input = NewStagingFile("x");
        ASSERT_TRUE(store.CreateStagingFile(input).ok());

        FileRecord file;
        file.id = input.id;
        file.name = input.name;
        file.mime = "text/plain";
        auto promoted = store.PromoteStagingFile("not-held", file, []() {
            return harbor::core::Ok();
        });
        ASSERT_FALSE(promoted.ok());
        EXPECT_EQ(promoted.error().code, ErrorCode::kConflict);
    }

    std::filesystem::remove(db_path);
}

TEST(MetadataStore, DeleteRows) {
    const auto db_path = MakeTempDbPath();

    {
        SqliteMetadataStore store(db_path.string());
        auto input = NewStagingFile("x");
        ASSERT_TRUE(store.CreateStagingFile(input).ok());

        auto removed = store.DeleteStagingFile(input.id);
        ASSERT_TRUE(removed.ok());
        EXPECT_EQ(removed.value().name, "x");
        auto again = store.DeleteStagingFile(input.id);
        ASSERT_FALSE(again.ok());
        EXPECT_EQ(again.error().code, ErrorCode::kNotFound);

        auto file = store.DeleteFile(input.id);
        ASSERT_FALSE(file.ok());
        EXPECT_EQ(file.error().code, ErrorCode::kNotFound);
    }

    std::filesystem::remove(db_path);
}
