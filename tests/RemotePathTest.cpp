#include <gtest/gtest.h>

#include "RemotePath.h"

TEST(RemotePathTest, Normalize) {
    EXPECT_EQ(RemotePath::normalize(""), ".");
    EXPECT_EQ(RemotePath::normalize("/"), "/");
    EXPECT_EQ(RemotePath::normalize("/srv//data/"), "/srv/data");
    EXPECT_EQ(RemotePath::normalize("/srv/./data/../logs"), "/srv/logs");
    EXPECT_EQ(RemotePath::normalize("/.."), "/");
    EXPECT_EQ(RemotePath::normalize("a/../.."), "..");
    EXPECT_EQ(RemotePath::normalize("./"), ".");
    EXPECT_EQ(RemotePath::normalize("~/x/"), "~/x");
}

TEST(RemotePathTest, ParentAndFileName) {
    EXPECT_EQ(RemotePath::parent("/srv/data/file.txt"), "/srv/data");
    EXPECT_EQ(RemotePath::parent("/x"), "/");
    EXPECT_EQ(RemotePath::parent("/"), "/");
    EXPECT_EQ(RemotePath::parent("a"), ".");

    EXPECT_EQ(RemotePath::fileName("/srv/data/file.txt"), "file.txt");
    EXPECT_EQ(RemotePath::fileName("/srv/data/"), "data");
    EXPECT_EQ(RemotePath::fileName("/"), "/");
}

TEST(RemotePathTest, JoinAndRelative) {
    EXPECT_EQ(RemotePath::join("/srv", "a.txt"), "/srv/a.txt");
    EXPECT_EQ(RemotePath::join("/srv/", "a.txt"), "/srv/a.txt");
    EXPECT_EQ(RemotePath::join("/srv", "/etc/hosts"), "/etc/hosts");
    EXPECT_EQ(RemotePath::join("", "a"), "a");

    EXPECT_EQ(RemotePath::relativeTo("/srv", "/srv/a/b.txt"), "a/b.txt");
    EXPECT_EQ(RemotePath::relativeTo("/", "/etc"), "etc");
    EXPECT_EQ(RemotePath::relativeTo("/srv", "/srv"), "");
    EXPECT_EQ(RemotePath::relativeTo("/srv", "/srvx/a"), "");
}

TEST(RemotePathTest, TildeHandling) {
    EXPECT_TRUE(RemotePath::needsTildeExpansion("~"));
    EXPECT_TRUE(RemotePath::needsTildeExpansion(" ~/docs"));
    EXPECT_FALSE(RemotePath::needsTildeExpansion("/home/~x"));

    EXPECT_EQ(RemotePath::tildeFallback("~"), ".");
    EXPECT_EQ(RemotePath::tildeFallback("~/"), ".");
    EXPECT_EQ(RemotePath::tildeFallback("~/docs/a.txt"), "docs/a.txt");

    EXPECT_EQ(RemotePath::substituteHome("~", "/home/alice"), "/home/alice");
    EXPECT_EQ(RemotePath::substituteHome("~/docs", "/home/alice"), "/home/alice/docs");
    EXPECT_EQ(RemotePath::substituteHome("/etc", "/home/alice"), "/etc");
}

TEST(RemotePathTest, ShellQuoting) {
    EXPECT_EQ(RemotePath::shQuote("plain"), "'plain'");
    EXPECT_EQ(RemotePath::shQuote("a b"), "'a b'");
    EXPECT_EQ(RemotePath::shQuote("it's"), "'it'\"'\"'s'");
}
