#include "progress_parser.hpp"
#include <algorithm>
#include <array>
#include <cmath>
#include <regex>
#include <fmt/core.h>

namespace gtxfer::core::progress {

namespace {

struct UnitMultiplier {
    std::string_view unit;
    double multiplier;
};

constexpr std::array<UnitMultiplier, 11> kUnits{{
    {"B",     1.0},
    // aws cli печатает "Bytes" для значений меньше 1 KiB
    {"Byte",  1.0},
    {"Bytes", 1.0},
    {"KiB",   1024.0},
    {"MiB",   1024.0 * 1024.0},
    {"GiB",   1024.0 * 1024.0 * 1024.0},
    {"TiB",   1024.0 * 1024.0 * 1024.0 * 1024.0},
    {"KB",    1e3},
    {"MB",    1e6},
    {"GB",    1e9},
    {"TB",    1e12},
}};

auto unit_multiplier(std::string_view unit) -> std::optional<double> {
    auto it = std::find_if(kUnits.begin(), kUnits.end(),
                           [&](const UnitMultiplier& u) { return u.unit == unit; });
    if (it == kUnits.end()) return std::nullopt;
    return it->multiplier;
}

const std::regex& size_regex() {
    static const std::regex re(R"(^\s*([0-9]+(?:\.[0-9]+)?)\s*([A-Za-z]+)\s*$)");
    return re;
}

// Скорость необязательна: aws печатает строки Completed и без неё
const std::regex& progress_regex() {
    static const std::regex re(
        R"(Completed\s+([0-9.]+\s*[A-Za-z]+)/~?([0-9.]+\s*[A-Za-z]+)(?:\s*\(([0-9.]+\s*[A-Za-z]+)/s\))?)");
    return re;
}

} // namespace

auto try_convert_to_bytes(std::string_view size_text) -> std::optional<std::uint64_t>
{
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_match(size_text.begin(), size_text.end(), m, size_regex())) {
        return std::nullopt;
    }

    auto multiplier = unit_multiplier(m[2].str());
    if (!multiplier) return std::nullopt;

    double value = 0.0;
    try {
        value = std::stod(m[1].str());
    } catch (const std::exception&) {
        return std::nullopt;
    }

    return static_cast<std::uint64_t>(std::llround(value * *multiplier));
}

auto convert_to_bytes(std::string_view size_text) -> std::uint64_t {
    return try_convert_to_bytes(size_text).value_or(0);
}

auto parse_progress(std::string_view line) -> std::optional<ProgressSample>
{
    std::match_results<std::string_view::const_iterator> m;
    if (!std::regex_search(line.begin(), line.end(), m, progress_regex())) {
        return std::nullopt;
    }

    auto completed = try_convert_to_bytes(m[1].str());
    auto total = try_convert_to_bytes(m[2].str());
    if (!completed || !total) {
        return std::nullopt;
    }

    ProgressSample sample{
        .completed_bytes = *completed,
        .total_bytes = *total,
    };

    if (m[3].matched) {
        auto speed = try_convert_to_bytes(m[3].str());
        if (!speed) {
            return std::nullopt;
        }
        sample.bytes_per_second = static_cast<double>(*speed);
        sample.speed_label = m[3].str() + "/s";
    }
    return sample;
}

auto format_size(std::uint64_t bytes) -> std::string
{
    if (bytes == 0) return "0 B";

    constexpr std::array<std::string_view, 6> labels{"B", "KB", "MB", "GB", "TB", "PB"};
    double size = static_cast<double>(bytes);
    std::size_t idx = 0;
    while (size >= 1024.0 && idx + 1 < labels.size()) {
        size /= 1024.0;
        ++idx;
    }
    return fmt::format("{:.1f} {}", size, labels[idx]);
}

auto estimate_eta(std::uint64_t remaining_bytes, double bytes_per_second) -> std::string
{
    if (!(bytes_per_second > 0.0)) return {};

    const auto seconds = static_cast<std::uint64_t>(
        static_cast<double>(remaining_bytes) / bytes_per_second);

    if (seconds < 60) {
        return fmt::format("{}s", seconds);
    }
    if (seconds < 3600) {
        return fmt::format("{}m {}s", seconds / 60, seconds % 60);
    }
    return fmt::format("{}h {}m", seconds / 3600, (seconds % 3600) / 60);
}

auto render_progress_bar(std::uint64_t completed,
                         std::uint64_t total,
                         std::string_view speed_label,
                         std::optional<double> bytes_per_second,
                         int width) -> std::string
{
    if (total == 0 || width <= 0) return {};

    const double ratio = static_cast<double>(completed) / static_cast<double>(total);
    const int filled = std::min(width, static_cast<int>(std::floor(width * ratio)));
    const int percent = std::min(100, static_cast<int>(std::floor(100.0 * ratio)));

    std::string bar;
    for (int i = 0; i < width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    std::string line = fmt::format("[{}] {:3d}% {}/{}",
                                   bar, percent, format_size(completed), format_size(total));
    if (!speed_label.empty()) {
        line += fmt::format(" {}", speed_label);
    }
    if (bytes_per_second && completed < total) {
        auto eta = estimate_eta(total - completed, *bytes_per_second);
        if (!eta.empty()) {
            line += fmt::format(" ETA {}", eta);
        }
    }
    return line;
}

} // namespace gtxfer::core::progress
