// tests/test_layer1_base/test_format_tools.cpp
#include "bp_base.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <string>

using namespace blkpipe::format_tools;
using namespace ::testing;
using namespace std::chrono_literals;

TEST(FormatToolsTest, HumanBytes_SmallValuesArePlainBytes)
{
    EXPECT_EQ(human_bytes(0), "0 B");
    EXPECT_EQ(human_bytes(512), "512 B");
    EXPECT_EQ(human_bytes(1023), "1023 B");
}

TEST(FormatToolsTest, HumanBytes_ScalesToBinaryUnits)
{
    EXPECT_EQ(human_bytes(1024), "1.00 KiB");
    EXPECT_EQ(human_bytes(1536), "1.50 KiB");
    EXPECT_EQ(human_bytes(64ull * 1024 * 1024), "64.00 MiB");
    EXPECT_EQ(human_bytes(3ull * 1024 * 1024 * 1024), "3.00 GiB");
}

TEST(FormatToolsTest, HumanBytes_StopsAtLargestUnit)
{
    // 2048 PiB stays in PiB rather than running off the unit table.
    EXPECT_EQ(human_bytes(2048ull * 1024 * 1024 * 1024 * 1024 * 1024), "2048.00 PiB");
}

TEST(FormatToolsTest, HumanRate_ZeroElapsedIsNotAvailable)
{
    EXPECT_EQ(human_rate(1000, 0ns), "n/a");
}

TEST(FormatToolsTest, HumanRate_BytesPerSecond)
{
    EXPECT_EQ(human_rate(2 * 1024 * 1024, 2s), "1.00 MiB/s");
    EXPECT_EQ(human_rate(500, 1s), "500 B/s");
}

TEST(FormatToolsTest, FormattedTime_HasMicrosecondFraction)
{
    const std::string text = formatted_time(std::chrono::system_clock::now());
    EXPECT_THAT(text, MatchesRegex("[0-9]{4}-[0-9]{2}-[0-9]{2} [0-9]{2}:[0-9]{2}:[0-9]{2}\\.[0-9]{6}"));
}

TEST(FormatToolsTest, MakeBuffer_FormatsArguments)
{
    auto mb = make_buffer("chunk {} at offset {}", 3, 196608);
    EXPECT_EQ(std::string(mb.data(), mb.size()), "chunk 3 at offset 196608");
}

TEST(FormatToolsTest, FilenameOnly_StripsDirectories)
{
    static_assert(filename_only("/a/b/c.cpp") == "c.cpp");
    EXPECT_EQ(filename_only("src/transfer/read_pipeline.cpp"), "read_pipeline.cpp");
    EXPECT_EQ(filename_only("plain.cpp"), "plain.cpp");
    EXPECT_EQ(filename_only("dir/"), "");
}
