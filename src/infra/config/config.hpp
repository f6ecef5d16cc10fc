#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "../retry.hpp"

namespace gtxfer::args_parser{
    struct CLIArgs;
}

namespace gtxfer::infra {

inline constexpr std::string_view kDefaultProfile = "gt-logs";
inline constexpr std::string_view kDefaultAwsCli = "aws";

struct Config {
    // Remote
    std::optional<std::string> profile;
    std::optional<std::string> aws_cli;
    std::optional<std::uint32_t> command_timeout_s;   // ls / verify

    // Retry
    std::optional<int> max_retries;
    std::optional<std::uint32_t> initial_delay_ms;
    std::optional<std::uint32_t> max_delay_ms;

    // Behavior
    bool verify = false;
    bool checksum = false;
    std::optional<bool> resume;
    bool progress = true;
    bool quiet = false;

    // Paths
    std::optional<std::filesystem::path> checkpoint_path;
    std::vector<std::string> exclude_patterns;
    std::vector<std::string> include_patterns;

    // Слияние с другим Config (например, из CLI); other имеет приоритет
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_profile() const -> std::string;
    [[nodiscard]] auto effective_aws_cli() const -> std::string;
    [[nodiscard]] auto effective_checkpoint_path() const -> std::filesystem::path;
    [[nodiscard]] auto should_resume() const -> bool { return resume.value_or(false); }
    [[nodiscard]] auto command_timeout() const -> std::chrono::milliseconds;
    [[nodiscard]] auto retry_policy() const -> RetryPolicy;

    // max_retries >= 1, max_delay >= initial_delay
    [[nodiscard]] auto validate() const -> std::expected<void, std::string>;
};

/// Загружает конфигурацию из файла YAML.
/// Ищет файл в порядке:
///   1. ./.gtxfer.yaml
///   2. $XDG_CONFIG_HOME/gtxfer/config.yaml или ~/.config/gtxfer/config.yaml
/// Возвращает пустой Config, если файл не найден.
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

[[nodiscard]] auto load_config_from(const std::filesystem::path& path) -> std::expected<Config, std::string>;

// Путь пользовательского файла (куда пишет --set-profile)
[[nodiscard]] auto user_config_path() -> std::filesystem::path;

/// Записывает profile в пользовательский файл, сохраняя остальные ключи
[[nodiscard]] auto save_default_profile(const std::string& profile,
                                        const std::filesystem::path& path = user_config_path())
    -> std::expected<void, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const struct gtxfer::args_parser::CLIArgs& args) -> Config;

} // namespace gtxfer::infra
