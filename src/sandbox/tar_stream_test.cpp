#include "sandbox/tar_stream.hpp"

#include <gtest/gtest.h>

using namespace stockade::sandbox;

TEST(TarStream, Layout)
{
    const auto archive = BuildTar({TarEntry{"stockade_task.py", "print(42)\n", 0644}});
    // header + one data block + two terminating blocks
    EXPECT_EQ(archive.size(), 4u * 512);
    EXPECT_EQ(archive.compare(257, 5, "ustar"), 0);
    EXPECT_EQ(archive[156], '0');
}

TEST(TarStream, ParseKeepsOrderAndContent)
{
    const std::string binary("\x89PNG\0\x01\x02", 7);
    const auto entries = ParseTar(BuildTar({
        TarEntry{"a.txt", std::string(1500, 'a'), 0600},
        TarEntry{"screen.png", binary, 0644},
    }));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "a.txt");
    EXPECT_EQ(entries[0].data.size(), 1500u);
    EXPECT_EQ(entries[0].mode, 0600u);
    EXPECT_EQ(entries[1].name, "screen.png");
    EXPECT_EQ(entries[1].data, binary);
}

TEST(TarStream, EmptyArchive)
{
    EXPECT_TRUE(ParseTar(BuildTar({})).empty());
    EXPECT_TRUE(ParseTar({}).empty());
}

TEST(TarStream, RejectsCorruptHeader)
{
    auto archive = BuildTar({TarEntry{"x", "data", 0644}});
    archive[0] = 'y';
    EXPECT_THROW(ParseTar(archive), std::runtime_error);
}

TEST(TarStream, RejectsTruncatedEntry)
{
    const auto archive = BuildTar({TarEntry{"x", std::string(2000, 'z'), 0644}});
    EXPECT_THROW(ParseTar(std::string_view(archive).substr(0, 1024)), std::runtime_error);
}

TEST(TarStream, RejectsLongNames)
{
    EXPECT_THROW(BuildTar({TarEntry{std::string(120, 'n'), "", 0644}}), std::invalid_argument);
    EXPECT_THROW(BuildTar({TarEntry{"", "", 0644}}), std::invalid_argument);
}
