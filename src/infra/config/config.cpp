
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <fstream>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"
#include "../../extensions/checkpoint_store.hpp"

namespace gtxfer::infra {
    void Config::merge_with(const Config& other) {
        if (other.profile) profile = other.profile;
        if (other.aws_cli) aws_cli = other.aws_cli;
        if (other.command_timeout_s) command_timeout_s = other.command_timeout_s;
        if (other.max_retries) max_retries = other.max_retries;
        if (other.initial_delay_ms) initial_delay_ms = other.initial_delay_ms;
        if (other.max_delay_ms) max_delay_ms = other.max_delay_ms;
        if (other.checkpoint_path) checkpoint_path = other.checkpoint_path;
        if (other.resume) resume = other.resume;
        if (other.verify) verify = true;
        if (other.checksum) checksum = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;

        if (!other.exclude_patterns.empty()) exclude_patterns = other.exclude_patterns;
        if (!other.include_patterns.empty()) include_patterns = other.include_patterns;
    }

    auto Config::effective_profile() const -> std::string {
        return profile.value_or(std::string(kDefaultProfile));
    }

    auto Config::effective_aws_cli() const -> std::string {
        return aws_cli.value_or(std::string(kDefaultAwsCli));
    }

    auto Config::effective_checkpoint_path() const -> std::filesystem::path {
        return checkpoint_path.value_or(extensions::CheckpointStore::default_checkpoint_path());
    }

    auto Config::command_timeout() const -> std::chrono::milliseconds {
        return std::chrono::seconds(command_timeout_s.value_or(30));
    }

    auto Config::retry_policy() const -> RetryPolicy {
        RetryPolicy policy{};
        policy.max_attempts = max_retries.value_or(3);
        policy.initial_delay = std::chrono::milliseconds(initial_delay_ms.value_or(1000));
        policy.max_delay = std::chrono::milliseconds(max_delay_ms.value_or(60000));
        return policy;
    }

    auto Config::validate() const -> std::expected<void, std::string> {
        if (max_retries && *max_retries < 1) {
            return std::unexpected(fmt::format("max_retries must be at least 1 (got {})", *max_retries));
        }
        const auto policy = retry_policy();
        if (policy.max_delay < policy.initial_delay) {
            return std::unexpected(fmt::format("max_delay_ms ({}) is smaller than initial_delay_ms ({})",
                                               policy.max_delay.count(), policy.initial_delay.count()));
        }
        if (aws_cli && aws_cli->empty()) {
            return std::unexpected(std::string("aws_cli must not be empty"));
        }
        return {};
    }

    auto user_config_path() -> std::filesystem::path {
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && *config_home) {
            return std::filesystem::path(config_home) / "gtxfer" / "config.yaml";
        }
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::filesystem::path(home) / ".config" / "gtxfer" / "config.yaml";
        }
        return ".gtxfer.yaml";
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".gtxfer.yaml");

        // 2. Пользовательский файл
        paths.push_back(user_config_path());

        return paths;
    }

    auto load_config_from(const std::filesystem::path& path) -> std::expected<Config, std::string> {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};
            if (config.IsNull()) {
                return cfg; // пустой файл
            }
            if (!config.IsMap()) {
                return std::unexpected(fmt::format("Failed to parse {}: top level must be a mapping", path.string()));
            }

            if (config["profile"]) cfg.profile = config["profile"].as<std::string>();
            if (config["aws_cli"]) cfg.aws_cli = config["aws_cli"].as<std::string>();
            if (config["command_timeout_s"]) cfg.command_timeout_s = config["command_timeout_s"].as<std::uint32_t>();

            if (config["max_retries"]) cfg.max_retries = config["max_retries"].as<int>();
            if (config["initial_delay_ms"]) cfg.initial_delay_ms = config["initial_delay_ms"].as<std::uint32_t>();
            if (config["max_delay_ms"]) cfg.max_delay_ms = config["max_delay_ms"].as<std::uint32_t>();

            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["checksum"]) cfg.checksum = config["checksum"].as<bool>();
            if (config["resume"]) cfg.resume = config["resume"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();

            if (config["checkpoint_path"]) cfg.checkpoint_path = config["checkpoint_path"].as<std::string>();

            if (config["exclude"]) {
                for (const auto& pat : config["exclude"]) {
                    cfg.exclude_patterns.push_back(pat.as<std::string>());
                }
            }
            if (config["include"]) {
                for (const auto& pat : config["include"]) {
                    cfg.include_patterns.push_back(pat.as<std::string>());
                }
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from(path);
        }

        // Файл не найден, возвращаем пустой конфиг
        return Config{};
    }

    auto save_default_profile(const std::string& profile, const std::filesystem::path& path)
        -> std::expected<void, std::string>
    {
        if (profile.empty()) {
            return std::unexpected(std::string("Profile name must not be empty"));
        }

        YAML::Node node;
        std::error_code ec;
        if (std::filesystem::exists(path, ec)) {
            try {
                node = YAML::LoadFile(path.string());
            } catch (const YAML::Exception& e) {
                return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
            }
        }
        node["profile"] = profile;

        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return std::unexpected(fmt::format("Cannot create {}: {}", path.parent_path().string(), ec.message()));
            }
        }

        std::ofstream ofs(path, std::ios::trunc);
        if (!ofs) {
            return std::unexpected(fmt::format("Cannot write {}", path.string()));
        }
        ofs << node << '\n';
        if (!ofs) {
            return std::unexpected(fmt::format("Write to {} failed", path.string()));
        }
        return {};
    }

    [[nodiscard]]
    auto config_from_cli(const __CLI& args) -> Config {
        Config cfg{};
        cfg.profile = args.profile;
        cfg.max_retries = args.max_retries;
        cfg.verify = args.verify;
        cfg.checksum = args.checksum;
        if (args.resume) cfg.resume = true;
        if (args.no_resume) cfg.resume = false;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        if (args.state_file) cfg.checkpoint_path = *args.state_file;
        cfg.include_patterns = args.include_patterns;
        cfg.exclude_patterns = args.exclude_patterns;
        return cfg;
    }

} // namespace gtxfer::infra
