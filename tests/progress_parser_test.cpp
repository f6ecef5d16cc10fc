#include <gtest/gtest.h>

#include "core/progress/progress_parser.hpp"

#include <string>
#include <vector>

using namespace gtxfer::core::progress;

TEST(ConvertToBytesTest, BinaryUnits)
{
    EXPECT_EQ(convert_to_bytes("256.0 KiB"), 262144u);
    EXPECT_EQ(convert_to_bytes("1.5 MiB"), 1572864u);
    EXPECT_EQ(convert_to_bytes("2.0 GiB"), 2147483648u);
    EXPECT_EQ(convert_to_bytes("1 TiB"), 1099511627776u);
}

TEST(ConvertToBytesTest, DecimalUnitsAndBytes)
{
    EXPECT_EQ(convert_to_bytes("1.5 KB"), 1500u);
    EXPECT_EQ(convert_to_bytes("3 MB"), 3000000u);
    EXPECT_EQ(convert_to_bytes("512 Bytes"), 512u);
    EXPECT_EQ(convert_to_bytes("1 Byte"), 1u);
    EXPECT_EQ(convert_to_bytes("0 B"), 0u);
}

TEST(ConvertToBytesTest, GarbageIsZero)
{
    EXPECT_EQ(convert_to_bytes("garbage"), 0u);
    EXPECT_EQ(convert_to_bytes(""), 0u);
    EXPECT_EQ(convert_to_bytes("12 parsecs"), 0u);
    EXPECT_EQ(convert_to_bytes("KiB"), 0u);
    EXPECT_FALSE(try_convert_to_bytes("1..5 MiB").has_value());
}

TEST(FormatSizeTest, DividesBy1024WithDecimalLabels)
{
    EXPECT_EQ(format_size(0), "0 B");
    EXPECT_EQ(format_size(512), "512.0 B");
    EXPECT_EQ(format_size(1536), "1.5 KB");
    EXPECT_EQ(format_size(1048576), "1.0 MB");
    EXPECT_EQ(format_size(1073741824ull * 3), "3.0 GB");
}

TEST(EstimateEtaTest, Formats)
{
    EXPECT_EQ(estimate_eta(30, 1.0), "30s");
    EXPECT_EQ(estimate_eta(125, 1.0), "2m 5s");
    EXPECT_EQ(estimate_eta(7260, 1.0), "2h 1m");
    EXPECT_EQ(estimate_eta(100, 0.0), "");
}

// Строки, записанные с реального `aws s3 cp`
struct CapturedLine {
    std::string line;
    bool has_progress;
    std::uint64_t completed;
    std::uint64_t total;
    std::string speed_label;
};

TEST(ParseProgressTest, CapturedOutputCorpus)
{
    const std::vector<CapturedLine> corpus{
        {"Completed 256.0 KiB/1.5 MiB (300.5 KiB/s) with 1 file(s) remaining",
         true, 262144, 1572864, "300.5 KiB/s"},
        {"Completed 1.0 MiB/~2.5 GiB (10.2 MiB/s) with ~3 file(s) remaining",
         true, 1048576, 2684354560, "10.2 MiB/s"},
        {"Completed 512 Bytes/512 Bytes (1.2 KiB/s) with 1 file(s) remaining",
         true, 512, 512, "1.2 KiB/s"},
        {"Completed 256.0 KiB/1.5 MiB with 1 file(s) remaining",
         true, 262144, 1572864, ""},
        {"upload: ./logs/a.tar.gz to s3://gt-logs/2024/a.tar.gz", false, 0, 0, ""},
        {"download: s3://gt-logs/a.tar.gz to ./a.tar.gz", false, 0, 0, ""},
        {"upload failed: ./a.tar.gz to s3://gt-logs/a.tar.gz An error occurred (AccessDenied)",
         false, 0, 0, ""},
        {"", false, 0, 0, ""},
    };

    for (const auto& c : corpus) {
        SCOPED_TRACE(c.line);
        auto sample = parse_progress(c.line);
        ASSERT_EQ(sample.has_value(), c.has_progress);
        if (!sample) continue;
        EXPECT_EQ(sample->completed_bytes, c.completed);
        EXPECT_EQ(sample->total_bytes, c.total);
        EXPECT_EQ(sample->speed_label, c.speed_label);
        EXPECT_EQ(sample->bytes_per_second.has_value(), !c.speed_label.empty());
    }
}

TEST(ParseProgressTest, SpeedInBytesPerSecond)
{
    auto sample = parse_progress("Completed 256.0 KiB/1.5 MiB (300.5 KiB/s) with 1 file(s) remaining");
    ASSERT_TRUE(sample.has_value());
    ASSERT_TRUE(sample->bytes_per_second.has_value());
    EXPECT_DOUBLE_EQ(*sample->bytes_per_second, 307712.0);
}

TEST(ParseProgressTest, UnknownUnitIsNoProgress)
{
    EXPECT_FALSE(parse_progress("Completed 1.0 QiB/2.0 MiB (1.0 MiB/s)").has_value());
    EXPECT_FALSE(parse_progress("Completed 1.0 MiB/2.0 MiB (3.0 QiB/s)").has_value());
}

TEST(RenderProgressBarTest, HalfDone)
{
    EXPECT_EQ(render_progress_bar(50, 100, "1.0 MiB/s", std::nullopt, 10),
              "[█████░░░░░]  50% 50.0 B/100.0 B 1.0 MiB/s");
}

TEST(RenderProgressBarTest, EtaAppendedWhenSpeedKnown)
{
    auto line = render_progress_bar(0, 600, "", 10.0, 4);
    EXPECT_EQ(line, "[░░░░]   0% 0 B/600.0 B ETA 1m 0s");
}

TEST(RenderProgressBarTest, CompleteAndEmpty)
{
    EXPECT_EQ(render_progress_bar(100, 100, "", 5.0, 4), "[████] 100% 100.0 B/100.0 B");
    EXPECT_EQ(render_progress_bar(0, 0, "", std::nullopt), "");
}
