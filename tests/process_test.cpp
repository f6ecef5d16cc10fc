#include <gtest/gtest.h>

#include "adapters/process.hpp"

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace gtxfer::adapters::process;
using gtxfer::infra::ErrorCode;

namespace {

auto sh(const std::string& script) -> std::vector<std::string> {
    return {"/bin/sh", "-c", script};
}

struct Collected {
    std::vector<std::string> lines;
    LineCallback callback() {
        return [this](std::string_view line) { lines.emplace_back(line); };
    }
};

} // namespace

TEST(ProcessTest, CollectsLinesAndExitCode)
{
    Collected out;
    auto rc = run(sh("echo one; echo two"), out.callback());

    ASSERT_TRUE(rc.has_value()) << rc.error().message;
    EXPECT_EQ(*rc, 0);
    EXPECT_EQ(out.lines, (std::vector<std::string>{"one", "two"}));
}

TEST(ProcessTest, SplitsOnCarriageReturn)
{
    Collected out;
    auto rc = run(sh("printf 'Completed 1/2\\rCompleted 2/2\\nupload: done'"), out.callback());

    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(out.lines, (std::vector<std::string>{"Completed 1/2", "Completed 2/2", "upload: done"}));
}

TEST(ProcessTest, MergesStderr)
{
    Collected out;
    auto rc = run(sh("echo out; echo err 1>&2"), out.callback());

    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(out.lines.size(), 2u);
    EXPECT_NE(std::find(out.lines.begin(), out.lines.end(), "err"), out.lines.end());
}

TEST(ProcessTest, ReportsNonZeroExit)
{
    auto rc = run(sh("exit 3"), nullptr);
    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(*rc, 3);
}

TEST(ProcessTest, SignalledChildGives128PlusSignal)
{
    auto rc = run(sh("kill -TERM $$"), nullptr);
    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(*rc, 128 + 15);
}

TEST(ProcessTest, StdinIsClosed)
{
    Collected out;
    auto rc = run(sh("cat; echo end"), out.callback());
    ASSERT_TRUE(rc.has_value());
    EXPECT_EQ(out.lines, (std::vector<std::string>{"end"}));
}

TEST(ProcessTest, TimeoutKillsChild)
{
    const auto start = std::chrono::steady_clock::now();
    auto rc = run(sh("sleep 10"), nullptr, std::chrono::milliseconds(200));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(rc.has_value());
    EXPECT_EQ(rc.error().code, ErrorCode::Timeout);
    EXPECT_LT(elapsed, std::chrono::seconds(5));
}

TEST(ProcessTest, MissingExecutableIsSpawnFailure)
{
    auto rc = run({"/nonexistent/gtxfer-no-such-tool", "s3", "ls"}, nullptr);
    ASSERT_FALSE(rc.has_value());
    EXPECT_EQ(rc.error().code, ErrorCode::SpawnFailed);
}

TEST(ProcessTest, EmptyCommandIsRejected)
{
    auto rc = run({}, nullptr);
    ASSERT_FALSE(rc.has_value());
    EXPECT_EQ(rc.error().code, ErrorCode::InvalidArgument);
}

TEST(ProcessTest, FormatCommandQuotesSpaces)
{
    EXPECT_EQ(format_command({"aws", "s3", "cp", "my file.txt", "s3://b/k"}),
              "aws s3 cp \"my file.txt\" s3://b/k");
}
