#include <gtest/gtest.h>

#include "FileEntry.h"

TEST(FileEntryTest, TypeFromMode) {
    EXPECT_EQ(fileTypeFromMode(0040755), FileEntry::Type::Directory);
    EXPECT_EQ(fileTypeFromMode(0120777), FileEntry::Type::Symlink);
    EXPECT_EQ(fileTypeFromMode(0100644), FileEntry::Type::File);
    EXPECT_EQ(fileTypeFromMode(0), FileEntry::Type::File);
}

TEST(FileEntryTest, PermissionStrings) {
    EXPECT_EQ(permissionString(0040755), "drwxr-xr-x");
    EXPECT_EQ(permissionString(0100644), "-rw-r--r--");
    EXPECT_EQ(permissionString(0120777), "lrwxrwxrwx");
    EXPECT_EQ(permissionString(0104755), "-rwsr-xr-x");
    EXPECT_EQ(permissionString(0102644), "-rw-r-Sr--");
    EXPECT_EQ(permissionString(0041777), "drwxrwxrwt");
}

TEST(FileEntryTest, ListingPutsDirectoriesFirst) {
    FileEntryList list;
    auto add = [&](const QString& name, FileEntry::Type type) {
        FileEntry e;
        e.name = name;
        e.type = type;
        list.push_back(e);
    };
    add("b.txt", FileEntry::Type::File);
    add("zeta", FileEntry::Type::Directory);
    add("a.txt", FileEntry::Type::File);
    add("alpha", FileEntry::Type::Directory);
    add("link", FileEntry::Type::Symlink);

    sortForListing(&list);
    ASSERT_EQ(list.size(), 5);
    EXPECT_EQ(list[0].name, "alpha");
    EXPECT_EQ(list[1].name, "zeta");
    EXPECT_EQ(list[2].name, "a.txt");
    EXPECT_EQ(list[3].name, "b.txt");
    EXPECT_EQ(list[4].name, "link");

    sortForListing(nullptr);
}

TEST(FileEntryTest, TypeNames) {
    EXPECT_EQ(fileTypeName(FileEntry::Type::File), "file");
    EXPECT_EQ(fileTypeName(FileEntry::Type::Directory), "directory");
    EXPECT_EQ(fileTypeName(FileEntry::Type::Symlink), "symlink");
}
