#include <gtest/gtest.h>

#include "infra/config/config.hpp"
#include "cli/args_parser/args_parser.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;
using namespace gtxfer::infra;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = fs::temp_directory_path() /
                    ("gtxfer_test_config_" +
                     std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(test_dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(test_dir_, ec);
    }

    auto write(const std::string& name, const std::string& text) const -> fs::path {
        const auto path = test_dir_ / name;
        std::ofstream(path) << text;
        return path;
    }

    fs::path test_dir_;
};

TEST_F(ConfigTest, DefaultsWithoutFile)
{
    Config cfg{};
    EXPECT_EQ(cfg.effective_profile(), "gt-logs");
    EXPECT_EQ(cfg.effective_aws_cli(), "aws");
    EXPECT_FALSE(cfg.should_resume());
    EXPECT_TRUE(cfg.progress);
    EXPECT_EQ(cfg.command_timeout(), std::chrono::seconds(30));

    const auto policy = cfg.retry_policy();
    EXPECT_EQ(policy.max_attempts, 3);
    EXPECT_EQ(policy.initial_delay, std::chrono::seconds(1));
    EXPECT_EQ(policy.max_delay, std::chrono::seconds(60));
    EXPECT_TRUE(cfg.validate().has_value());
}

TEST_F(ConfigTest, LoadsAllKeys)
{
    const auto path = write("config.yaml",
        "profile: prod-logs\n"
        "aws_cli: /usr/local/bin/aws\n"
        "max_retries: 5\n"
        "initial_delay_ms: 250\n"
        "max_delay_ms: 4000\n"
        "command_timeout_s: 10\n"
        "verify: true\n"
        "checksum: true\n"
        "resume: true\n"
        "progress: false\n"
        "quiet: true\n"
        "checkpoint_path: /var/tmp/gtxfer.json\n"
        "include:\n"
        "  - '*.tar.gz'\n"
        "exclude:\n"
        "  - '*.log'\n"
        "  - tmp\n");

    auto cfg = load_config_from(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    EXPECT_EQ(cfg->effective_profile(), "prod-logs");
    EXPECT_EQ(cfg->effective_aws_cli(), "/usr/local/bin/aws");
    EXPECT_EQ(cfg->retry_policy().max_attempts, 5);
    EXPECT_EQ(cfg->retry_policy().initial_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(cfg->retry_policy().max_delay, std::chrono::milliseconds(4000));
    EXPECT_EQ(cfg->command_timeout(), std::chrono::seconds(10));
    EXPECT_TRUE(cfg->verify);
    EXPECT_TRUE(cfg->checksum);
    EXPECT_TRUE(cfg->should_resume());
    EXPECT_FALSE(cfg->progress);
    EXPECT_TRUE(cfg->quiet);
    EXPECT_EQ(cfg->effective_checkpoint_path(), fs::path("/var/tmp/gtxfer.json"));
    EXPECT_EQ(cfg->include_patterns, (std::vector<std::string>{"*.tar.gz"}));
    EXPECT_EQ(cfg->exclude_patterns, (std::vector<std::string>{"*.log", "tmp"}));
}

TEST_F(ConfigTest, EmptyFileGivesDefaults)
{
    auto cfg = load_config_from(write("empty.yaml", ""));
    ASSERT_TRUE(cfg.has_value());
    EXPECT_FALSE(cfg->profile.has_value());
}

TEST_F(ConfigTest, MalformedFileIsAnError)
{
    auto cfg = load_config_from(write("bad.yaml", "max_retries: [1, 2\n"));
    EXPECT_FALSE(cfg.has_value());

    auto wrong_type = load_config_from(write("wrong.yaml", "max_retries: lots\n"));
    EXPECT_FALSE(wrong_type.has_value());

    auto not_a_map = load_config_from(write("list.yaml", "- a\n- b\n"));
    EXPECT_FALSE(not_a_map.has_value());
}

TEST_F(ConfigTest, CliOverridesFile)
{
    Config file{};
    file.profile = "file-profile";
    file.max_retries = 7;
    file.resume = true;
    file.exclude_patterns = {"*.log"};

    Config cli{};
    cli.max_retries = 2;
    cli.resume = false;
    cli.verify = true;

    file.merge_with(cli);
    EXPECT_EQ(file.effective_profile(), "file-profile");
    EXPECT_EQ(file.retry_policy().max_attempts, 2);
    EXPECT_FALSE(file.should_resume());
    EXPECT_TRUE(file.verify);
    EXPECT_EQ(file.exclude_patterns, (std::vector<std::string>{"*.log"}));
}

TEST_F(ConfigTest, ValidationRejectsBadValues)
{
    Config zero{};
    zero.max_retries = 0;
    EXPECT_FALSE(zero.validate().has_value());

    Config inverted{};
    inverted.initial_delay_ms = 5000;
    inverted.max_delay_ms = 100;
    EXPECT_FALSE(inverted.validate().has_value());

    Config empty_cli{};
    empty_cli.aws_cli = "";
    EXPECT_FALSE(empty_cli.validate().has_value());
}

TEST_F(ConfigTest, SaveDefaultProfileKeepsOtherKeys)
{
    const auto path = write("user.yaml", "max_retries: 4\nverify: true\n");

    ASSERT_TRUE(save_default_profile("archive", path).has_value());

    auto cfg = load_config_from(path);
    ASSERT_TRUE(cfg.has_value());
    EXPECT_EQ(cfg->effective_profile(), "archive");
    EXPECT_EQ(cfg->retry_policy().max_attempts, 4);
    EXPECT_TRUE(cfg->verify);
}

TEST_F(ConfigTest, SaveDefaultProfileCreatesDirectories)
{
    const auto path = test_dir_ / "xdg" / "gtxfer" / "config.yaml";
    ASSERT_TRUE(save_default_profile("archive", path).has_value());
    EXPECT_EQ(YAML::LoadFile(path.string())["profile"].as<std::string>(), "archive");

    EXPECT_FALSE(save_default_profile("", path).has_value());
}

TEST_F(ConfigTest, FromCliArgs)
{
    gtxfer::args_parser::CLIArgs args;
    args.profile = "cli-profile";
    args.max_retries = 6;
    args.no_resume = true;
    args.state_file = (test_dir_ / "s.json").string();
    args.include_patterns = {"*.gz"};
    args.progress = false;

    auto cfg = config_from_cli(args);
    EXPECT_EQ(cfg.effective_profile(), "cli-profile");
    EXPECT_EQ(cfg.retry_policy().max_attempts, 6);
    ASSERT_TRUE(cfg.resume.has_value());
    EXPECT_FALSE(*cfg.resume);
    EXPECT_EQ(cfg.effective_checkpoint_path(), test_dir_ / "s.json");
    EXPECT_EQ(cfg.include_patterns, (std::vector<std::string>{"*.gz"}));
    EXPECT_FALSE(cfg.progress);

    // Флаги, не заданные в CLI, не перетирают файл
    Config file{};
    file.resume = true;
    file.max_delay_ms = 9000;
    gtxfer::args_parser::CLIArgs bare;
    file.merge_with(config_from_cli(bare));
    EXPECT_TRUE(file.should_resume());
    EXPECT_EQ(file.retry_policy().max_delay, std::chrono::milliseconds(9000));
}

TEST(ArgsParserTest, UploadDirectory)
{
    const char* argv[] = {"gtxfer", "--dir", ".", "--dest", "s3://gt-logs/in/",
                          "--include", "*.gz", "--include", "*.zst",
                          "--max-retries", "5", "--resume", "--verify", "-p", "ops"};
    auto args = gtxfer::args_parser::parse_args(static_cast<int>(std::size(argv)), argv);

    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->directory, ".");
    EXPECT_EQ(args->destination, "s3://gt-logs/in/");
    EXPECT_EQ(args->include_patterns, (std::vector<std::string>{"*.gz", "*.zst"}));
    EXPECT_EQ(args->max_retries, 5);
    EXPECT_TRUE(args->resume);
    EXPECT_TRUE(args->verify);
    EXPECT_EQ(args->profile, "ops");
    EXPECT_TRUE(args->progress);
    EXPECT_EQ(args->output, ".");
}

TEST(ArgsParserTest, DownloadWithOutput)
{
    const char* argv[] = {"gtxfer", "-d", "s3://gt-logs/2024/", "-o", "/tmp/out", "--no-progress"};
    auto args = gtxfer::args_parser::parse_args(static_cast<int>(std::size(argv)), argv);

    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(args->download, "s3://gt-logs/2024/");
    EXPECT_EQ(args->output, "/tmp/out");
    EXPECT_FALSE(args->progress);
}

TEST(ArgsParserTest, RejectsConflictingFlags)
{
    const char* resume_both[] = {"gtxfer", "--resume", "--no-resume"};
    EXPECT_FALSE(gtxfer::args_parser::parse_args(3, resume_both).has_value());

    const char* zero_retries[] = {"gtxfer", "--max-retries", "0"};
    EXPECT_FALSE(gtxfer::args_parser::parse_args(3, zero_retries).has_value());
}
