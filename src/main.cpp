#include <iostream>
#include <fmt/core.h>
#include <fmt/ranges.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "core/batch/batch_orchestrator.hpp"
#include "core/discovery/discovery.hpp"
#include "core/progress/progress_parser.hpp"
#include "adapters/s3_cli.hpp"
#include "extensions/checkpoint_store.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <system_error>

using GIT = gtxfer::build_info::GitInfo;
using ARGS = gtxfer::args_parser::CLIArgs;
using CONFIG = gtxfer::infra::Config;
using ITEMS = std::vector<gtxfer::core::TransferItem>;

constexpr auto load_from_cli = gtxfer::infra::config_from_cli;
constexpr auto load_config_file = gtxfer::infra::load_config_from_file;
constexpr auto args_parser = gtxfer::args_parser::parse_args;
constexpr auto git = gtxfer::build_info::get_git_info();

namespace fs = std::filesystem;
namespace s3 = gtxfer::adapters::s3;
namespace discovery = gtxfer::core::discovery;
namespace infra = gtxfer::infra;

static auto
__out_git_verse(const GIT& git)
-> void {
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
__out_config_verse(const CONFIG& config)
-> void {
    const auto policy = config.retry_policy();
    fmt::print("Configuration:\n");
    fmt::print("Profile: {}\n", config.effective_profile());
    fmt::print("AWS CLI: {}\n", config.effective_aws_cli());
    fmt::print("Max retries: {}\n", policy.max_attempts);
    fmt::print("Backoff: {} ms .. {} ms\n", policy.initial_delay.count(), policy.max_delay.count());
    fmt::print("Command timeout: {} s\n", config.command_timeout().count() / 1000);
    fmt::print("Verify: {}\n", config.verify ? "yes" : "no");
    fmt::print("Checksum: {}\n", config.checksum ? "yes" : "no");
    fmt::print("Resume: {}\n", config.should_resume() ? "yes" : "no");
    fmt::print("Progress: {}\n", config.progress ? "yes" : "no");
    fmt::print("State file: {}\n", config.effective_checkpoint_path().string());
    fmt::print("Include: {}\n", config.include_patterns);
    fmt::print("Exclude: {}\n", config.exclude_patterns);
}

[[nodiscard]]
static auto
__upload_items(const ARGS& args, const CONFIG& config)
-> infra::Result<ITEMS> {
    if (args.destination.empty() || !s3::parse_s3_uri(args.destination)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("--dest must be an s3:// URI (got '{}')", args.destination)));
    }

    ITEMS items;
    for (const auto& file : args.files) {
        const fs::path path(file);
        std::error_code ec;
        const auto size = fs::file_size(path, ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("Cannot read {}: {}", file, ec.message())));
        }
        items.push_back({
            .source = path.string(),
            .target = s3::join_key(args.destination, path.filename().string()),
            .size = size,
        });
    }

    if (args.directory) {
        const fs::path root(*args.directory);
        auto found = discovery::discover(root, {config.include_patterns, config.exclude_patterns});
        if (!found) {
            return std::unexpected(std::move(found.error()));
        }
        // Структура каталогов сохраняется в ключах
        for (const auto& path : *found) {
            std::error_code ec;
            const auto size = fs::file_size(path, ec);
            items.push_back({
                .source = path.string(),
                .target = s3::join_key(args.destination, path.lexically_relative(root).generic_string()),
                .size = ec ? std::nullopt : std::optional<std::uint64_t>(size),
            });
        }
    }

    if (items.empty() && args.files.empty() && !args.directory) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            "Nothing to upload: pass --file or --dir (or --download)"));
    }
    return items;
}

[[nodiscard]]
static auto
__download_items(const ARGS& args, const CONFIG& config, const s3::S3Cli& cli)
-> infra::Result<ITEMS> {
    auto loc = s3::parse_s3_uri(*args.download);
    if (!loc) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("--download must be an s3:// URI (got '{}')", *args.download)));
    }

    const fs::path output(args.output);
    ITEMS items;

    if (!loc->is_prefix()) {
        const auto name = fs::path(loc->key).filename();
        items.push_back({.source = loc->uri(), .target = (output / name).string(), .size = std::nullopt});
        return items;
    }

    auto objects = cli.list(loc->uri(), true);
    if (!objects) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DiscoveryFailed,
            fmt::format("Cannot list {}: {}", loc->uri(), objects.error().message)));
    }

    for (const auto& obj : *objects) {
        if (obj.key.empty() || obj.key.back() == '/') continue; // маркеры "папок"
        std::string_view relative(obj.key);
        if (relative.starts_with(loc->key)) relative.remove_prefix(loc->key.size());

        const auto filename = fs::path(relative).filename().string();
        if (discovery::matches_any(config.exclude_patterns, filename, relative)) continue;
        if (!config.include_patterns.empty()
            && !discovery::matches_any(config.include_patterns, filename, relative)) continue;

        items.push_back({
            .source = s3::S3Location{loc->bucket, obj.key}.uri(),
            .target = (output / fs::path(relative)).string(),
            .size = obj.size,
        });
    }
    return items;
}

static auto
__out_dry_run(const ITEMS& items, const std::string& destination, const CONFIG& config, bool download)
-> void {
    fmt::print("Destination: {}\n", destination);
    if (!config.include_patterns.empty()) {
        fmt::print("Include patterns: {}\n", fmt::join(config.include_patterns, ", "));
    }
    if (!config.exclude_patterns.empty()) {
        fmt::print("Exclude patterns: {}\n", fmt::join(config.exclude_patterns, ", "));
    }
    fmt::print("{} file(s) to {}\n", items.size(), download ? "download" : "upload");
    for (const auto& item : items) {
        fmt::print("  {} -> {}{}\n", item.source, item.target,
                   item.size ? fmt::format(" ({})", gtxfer::core::progress::format_size(*item.size)) : "");
    }
    fmt::print("Dry run complete. No files were {}.\n", download ? "downloaded" : "uploaded");
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.verbose) spdlog::set_level(spdlog::level::debug);
        if (args.quiet) spdlog::set_level(spdlog::level::warn);

        if (args.version) {
            __out_git_verse(git);
            return 0;
        }

        if (args.set_profile) {
            auto saved = infra::save_default_profile(*args.set_profile);
            if (!saved) {
                spdlog::error("Config error: {}", saved.error());
                return 1;
            }
            fmt::print("Default profile set to '{}' in {}\n", *args.set_profile,
                       infra::user_config_path().string());
            return 0;
        }

        // 1. Загрузить из файла
        auto config_res = load_config_file();
        if (!config_res) {
            auto err = infra::log_and_return(infra::make_error(infra::ErrorCode::InvalidConfig, config_res.error()));
            return err.to_exit_code();
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        auto cli_config = load_from_cli(args);

        spdlog::debug("Merging CLI config with file config...");
        config.merge_with(cli_config); // CLI имеет приоритет

        if (auto valid = config.validate(); !valid) {
            auto err = infra::log_and_return(infra::make_error(infra::ErrorCode::InvalidConfig, valid.error()));
            return err.to_exit_code();
        }

        if (args.show_config) {
            __out_config_verse(config);
            return 0;
        }

        const gtxfer::extensions::CheckpointStore store(config.effective_checkpoint_path());

        if (args.clean_state) {
            const bool existed = store.exists();
            if (auto cleared = store.clear(); !cleared) {
                return infra::log_and_return(std::move(cleared.error())).to_exit_code();
            }
            fmt::print("{} {}\n", existed ? "Removed saved state" : "No saved state at",
                       store.path().string());
            return 0;
        }

        const s3::S3Cli cli(s3::S3CliOptions{
            .executable = config.effective_aws_cli(),
            .profile = config.effective_profile(),
            .command_timeout = config.command_timeout(),
        });

        const bool download = args.download.has_value();
        const auto kind = download ? gtxfer::core::OperationKind::Download
                                   : gtxfer::core::OperationKind::Upload;
        const std::string destination = download
            ? fs::weakly_canonical(fs::path(args.output)).string()
            : args.destination;
        // В состоянии хранится общий удалённый путь: префикс-источник для загрузки
        const std::string remote_root = download ? *args.download : args.destination;

        spdlog::debug("Collecting items...");
        auto items_res = download ? __download_items(args, config, cli) : __upload_items(args, config);
        if (!items_res) {
            return infra::log_and_return(std::move(items_res.error())).to_exit_code();
        }
        const auto& items = *items_res;

        if (args.dry_run) {
            __out_dry_run(items, destination, config, download);
            return 0;
        }

        if (items.empty() && !config.should_resume()) {
            spdlog::warn("No files matched; nothing to do");
            return 0;
        }

        spdlog::debug("Creating Progress Monitor...");
        infra::ProgressMonitor monitor(config.progress, config.quiet);

        gtxfer::core::BatchOptions options{
            .retry = config.retry_policy(),
            .verify = config.verify,
            .checksum = config.checksum,
            .resume = config.should_resume(),
            .remote_size = [&cli](const std::string& uri) { return cli.object_size(uri); },
        };
        const gtxfer::core::BatchOrchestrator orchestrator(store, monitor, std::move(options));

        auto transfer = [&](const gtxfer::core::TransferItem& item) -> infra::VoidResult {
            spdlog::debug("Running: {}", gtxfer::adapters::process::format_command(
                                             cli.copy_command(item.source, item.target)));
            return cli.copy(item.source, item.target,
                            [&monitor](std::string_view line) { monitor.on_line(line); });
        };

        auto start_time = std::chrono::steady_clock::now();
        auto result = orchestrator.run(kind, items, remote_root, transfer);
        auto end_time = std::chrono::steady_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

        if (!result) {
            return infra::log_and_return(std::move(result.error())).to_exit_code();
        }

        const auto& summary = *result;
        fmt::print("\n{}", gtxfer::core::render_summary(summary, kind));
        spdlog::info("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);

        return summary.failure_count > 0 ? 1 : 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
