#include "s3_cli.hpp"
#include <algorithm>
#include <cctype>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "core/progress/progress_parser.hpp"

namespace gtxfer::adapters::s3 {

namespace {

constexpr std::string_view kScheme = "s3://";

// Следующее слово, начиная с pos; pos сдвигается за него
auto next_token(std::string_view line, std::size_t& pos) -> std::string_view {
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    const auto start = pos;
    while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    return line.substr(start, pos - start);
}

auto is_digits(std::string_view text) -> bool {
    return !text.empty() && std::all_of(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isdigit(c) != 0; });
}

auto basename_of(std::string_view key) -> std::string_view {
    const auto slash = key.find_last_of('/');
    return slash == std::string_view::npos ? key : key.substr(slash + 1);
}

} // namespace

auto S3Location::uri() const -> std::string {
    return fmt::format("{}{}/{}", kScheme, bucket, key);
}

auto parse_s3_uri(std::string_view uri) -> std::optional<S3Location>
{
    if (uri.substr(0, kScheme.size()) != kScheme) {
        return std::nullopt;
    }
    auto rest = uri.substr(kScheme.size());
    const auto slash = rest.find('/');
    S3Location loc;
    loc.bucket = std::string(rest.substr(0, slash));
    if (slash != std::string_view::npos) {
        loc.key = std::string(rest.substr(slash + 1));
    }
    if (loc.bucket.empty()) {
        return std::nullopt;
    }
    return loc;
}

auto parse_ls_line(std::string_view line) -> std::optional<RemoteObject>
{
    std::size_t pos = 0;
    const auto date = next_token(line, pos);
    const auto time = next_token(line, pos);
    const auto size = next_token(line, pos);

    if (date.size() != 10 || date[4] != '-' || time.size() != 8 || time[2] != ':') {
        return std::nullopt;
    }
    if (!is_digits(size) || size.size() > 19) {
        return std::nullopt;
    }

    // Ключ - остаток строки, может содержать пробелы
    while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
    auto key = line.substr(pos);
    if (key.empty()) {
        return std::nullopt;
    }

    RemoteObject obj;
    obj.key = std::string(key);
    obj.size = std::stoull(std::string(size));
    obj.last_modified = fmt::format("{} {}", date, time);
    return obj;
}

auto join_key(std::string_view prefix, std::string_view relative) -> std::string
{
    while (!relative.empty() && relative.front() == '/') relative.remove_prefix(1);
    if (prefix.empty()) return std::string(relative);
    if (prefix.back() == '/') return fmt::format("{}{}", prefix, relative);
    return fmt::format("{}/{}", prefix, relative);
}

S3Cli::S3Cli(S3CliOptions options)
    : options_(std::move(options)) {}

void S3Cli::append_profile(std::vector<std::string>& argv) const {
    if (!options_.profile.empty()) {
        argv.emplace_back("--profile");
        argv.push_back(options_.profile);
    }
}

auto S3Cli::copy_command(const std::string& source, const std::string& target) const
    -> std::vector<std::string>
{
    std::vector<std::string> argv{options_.executable, "s3", "cp", source, target};
    append_profile(argv);
    return argv;
}

auto S3Cli::copy(const std::string& source,
                 const std::string& target,
                 const process::LineCallback& on_line) const -> infra::VoidResult
{
    // Последняя строка без прогресса обычно содержит причину отказа
    std::string last_message;
    auto collect = [&](std::string_view line) {
        if (!core::progress::parse_progress(line)) {
            last_message = std::string(line);
        }
        if (on_line) on_line(line);
    };

    auto exit_code = process::run(copy_command(source, target), collect);
    if (!exit_code) {
        return std::unexpected(std::move(exit_code.error()));
    }
    if (*exit_code != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailed,
            last_message.empty()
                ? fmt::format("Transfer exited with code {}", *exit_code)
                : fmt::format("Transfer exited with code {}: {}", *exit_code, last_message)));
    }
    return {};
}

auto S3Cli::list(const std::string& uri, bool recursive) const
    -> infra::Result<std::vector<RemoteObject>>
{
    std::vector<std::string> argv{options_.executable, "s3", "ls", uri};
    if (recursive) {
        argv.emplace_back("--recursive");
    }
    append_profile(argv);

    std::vector<RemoteObject> objects;
    std::string diagnostics;
    auto exit_code = process::run(argv, [&](std::string_view line) {
        if (auto obj = parse_ls_line(line)) {
            objects.push_back(std::move(*obj));
        } else {
            diagnostics = std::string(line);
        }
    }, options_.command_timeout);

    if (!exit_code) {
        return std::unexpected(std::move(exit_code.error()));
    }
    // `aws s3 ls` возвращает 1, если по префиксу ничего нет
    if (*exit_code == 1 && objects.empty() && diagnostics.empty()) {
        return objects;
    }
    if (*exit_code != 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::TransferFailed,
            fmt::format("Listing {} failed with code {}{}{}", uri, *exit_code,
                        diagnostics.empty() ? "" : ": ", diagnostics)));
    }
    return objects;
}

auto S3Cli::object_size(const std::string& uri) const -> infra::Result<std::uint64_t>
{
    auto loc = parse_s3_uri(uri);
    if (!loc || loc->is_prefix()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Not an object URI: {}", uri)));
    }

    auto objects = list(uri, false);
    if (!objects) {
        return std::unexpected(std::move(objects.error()));
    }

    // Без --recursive ls печатает только последний компонент ключа
    const auto name = basename_of(loc->key);
    for (const auto& obj : *objects) {
        if (obj.key == name || obj.key == loc->key) {
            return obj.size;
        }
    }
    return std::unexpected(infra::make_error(infra::ErrorCode::NotFound,
        fmt::format("Remote object not found: {}", uri)));
}

} // namespace gtxfer::adapters::s3
