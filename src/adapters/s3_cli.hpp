#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"
#include "process.hpp"

namespace gtxfer::adapters::s3 {

struct S3Location {
    std::string bucket;
    std::string key;

    [[nodiscard]] auto uri() const -> std::string;
    // Пустой ключ или ключ на '/' - префикс ("каталог")
    [[nodiscard]] auto is_prefix() const -> bool { return key.empty() || key.back() == '/'; }
};

struct RemoteObject {
    std::string key;
    std::uint64_t size = 0;
    std::string last_modified;
};

// "s3://bucket/path/to/key" -> {bucket, path/to/key}
[[nodiscard]] auto parse_s3_uri(std::string_view uri) -> std::optional<S3Location>;

// Строка `aws s3 ls`: "2024-01-15 10:30:45   12345678 path/to/file.tar.gz".
// Строки "PRE dir/" и прочие -> nullopt.
[[nodiscard]] auto parse_ls_line(std::string_view line) -> std::optional<RemoteObject>;

// prefix + '/' + relative без двойных слэшей
[[nodiscard]] auto join_key(std::string_view prefix, std::string_view relative) -> std::string;

struct S3CliOptions {
    std::string executable = "aws";
    std::string profile;                                          // пусто = без --profile
    std::chrono::milliseconds command_timeout = std::chrono::seconds(30); // для ls
};

/// Обёртка над внешним `aws s3`. Каждая операция - отдельный процесс.
class S3Cli {
public:
    explicit S3Cli(S3CliOptions options);

    [[nodiscard]] auto copy_command(const std::string& source, const std::string& target) const
        -> std::vector<std::string>;

    // Без таймаута: зависание передачи - забота самого инструмента
    [[nodiscard]] auto copy(const std::string& source,
                            const std::string& target,
                            const process::LineCallback& on_line) const -> infra::VoidResult;

    [[nodiscard]] auto list(const std::string& uri, bool recursive) const
        -> infra::Result<std::vector<RemoteObject>>;

    // Размер одного объекта; NotFound, если объекта нет
    [[nodiscard]] auto object_size(const std::string& uri) const -> infra::Result<std::uint64_t>;

    [[nodiscard]] auto options() const -> const S3CliOptions& { return options_; }

private:
    void append_profile(std::vector<std::string>& argv) const;

    S3CliOptions options_;
};

} // namespace gtxfer::adapters::s3
