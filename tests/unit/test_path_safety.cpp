#include <gtest/gtest.h>

#include "harbor/core/ids.h"
#include "harbor/storage/local_file_system.h"

TEST(PathSafety, AcceptsSimpleNames) {
    EXPECT_TRUE(harbor::storage::LocalFileSystem::IsSafeName("object1"));
    EXPECT_TRUE(harbor::storage::LocalFileSystem::IsSafeName("obj-1.txt"));
    EXPECT_TRUE(harbor::storage::LocalFileSystem::IsSafeName(harbor::core::GenerateObjectId()));
}

TEST(PathSafety, RejectsTraversal) {
    EXPECT_FALSE(harbor::storage::LocalFileSystem::IsSafeName("../secret"));
    EXPECT_FALSE(harbor::storage::LocalFileSystem::IsSafeName(".."));
    EXPECT_FALSE(harbor::storage::LocalFileSystem::IsSafeName("a/b"));
    EXPECT_FALSE(harbor::storage::LocalFileSystem::IsSafeName(""));
}

TEST(PathSafety, RejectsHiddenNames) {
    // Partial copies live next to resident files under dot-prefixed names.
    EXPECT_FALSE(harbor::storage::LocalFileSystem::IsSafeName(".abc.partial"));
}

TEST(ObjectIds, GeneratedIdsAreCanonical) {
    const auto id = harbor::core::GenerateObjectId();
    EXPECT_EQ(id.size(), 36u);
    EXPECT_TRUE(harbor::core::IsObjectId(id));
    EXPECT_NE(id, harbor::core::GenerateObjectId());
}

TEST(ObjectIds, RejectsNonCanonicalIds) {
    EXPECT_FALSE(harbor::core::IsObjectId(""));
    EXPECT_FALSE(harbor::core::IsObjectId("not-a-uuid"));
    EXPECT_FALSE(harbor::core::IsObjectId("../../etc/passwd"));
    EXPECT_FALSE(harbor::core::IsObjectId("6BA7B810-9DAD-11D1-80B4-00C04FD430C8"));
}
