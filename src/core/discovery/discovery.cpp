#include "discovery.hpp"
#include <algorithm>
#include <fnmatch.h>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gtxfer::core::discovery {

namespace {

namespace fs = std::filesystem;

auto sorted_entries(const fs::path& dir) -> infra::Result<std::vector<fs::directory_entry>>
{
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DiscoveryFailed,
            fmt::format("Cannot read directory {}: {}", dir.string(), ec.message())));
    }

    std::vector<fs::directory_entry> entries;
    for (const auto end = fs::directory_iterator(); it != end; it.increment(ec)) {
        if (ec) break;
        entries.push_back(*it);
    }
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DiscoveryFailed,
            fmt::format("Error while listing {}: {}", dir.string(), ec.message())));
    }

    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) { return a.path().filename() < b.path().filename(); });
    return entries;
}

auto walk(const fs::path& root,
          const fs::path& dir,
          const Filters& filters,
          std::vector<fs::path>& out) -> infra::VoidResult
{
    auto entries = sorted_entries(dir);
    if (!entries) {
        return std::unexpected(std::move(entries.error()));
    }

    for (const auto& entry : *entries) {
        const auto name = entry.path().filename().string();
        const auto rel = entry.path().lexically_relative(root).generic_string();

        std::error_code ec;
        if (entry.is_directory(ec) && !entry.is_symlink(ec)) {
            // Отсечение до спуска: исключённый каталог не просматривается вовсе
            if (matches_any(filters.exclude_patterns, name, rel)) {
                spdlog::debug("Pruned directory {}", rel);
                continue;
            }
            auto res = walk(root, entry.path(), filters, out);
            if (!res) return res;
            continue;
        }

        if (!entry.is_regular_file(ec)) {
            continue;
        }
        if (matches_any(filters.exclude_patterns, name, rel)) {
            continue;
        }
        if (!filters.include_patterns.empty() &&
            !matches_any(filters.include_patterns, name, rel)) {
            continue;
        }
        out.push_back(entry.path());
    }
    return {};
}

} // namespace

auto glob_match(std::string_view pattern, std::string_view text) -> bool {
    // fnmatch требует нуль-терминированных строк
    const std::string p(pattern);
    const std::string t(text);
    return ::fnmatch(p.c_str(), t.c_str(), 0) == 0;
}

auto matches_any(const std::vector<std::string>& patterns,
                 std::string_view filename,
                 std::string_view relative_path) -> bool
{
    return std::any_of(patterns.begin(), patterns.end(), [&](const std::string& pattern) {
        return glob_match(pattern, filename) || glob_match(pattern, relative_path);
    });
}

auto discover(const std::filesystem::path& root, const Filters& filters)
    -> infra::Result<std::vector<std::filesystem::path>>
{
    std::error_code ec;
    if (!fs::exists(root, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DiscoveryFailed,
            fmt::format("Directory does not exist: {}", root.string())));
    }
    if (!fs::is_directory(root, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DiscoveryFailed,
            fmt::format("Path is not a directory: {}", root.string())));
    }

    std::vector<fs::path> files;
    auto res = walk(root, root, filters, files);
    if (!res) {
        return std::unexpected(std::move(res.error()));
    }

    spdlog::debug("Discovered {} file(s) under {}", files.size(), root.string());
    return files;
}

} // namespace gtxfer::core::discovery
