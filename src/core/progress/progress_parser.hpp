// src/core/progress/progress_parser.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace gtxfer::core::progress {

struct ProgressSample {
    std::uint64_t completed_bytes = 0;
    std::uint64_t total_bytes = 0;
    std::optional<double> bytes_per_second;
    std::string speed_label; // как напечатал инструмент, например "300.5 KiB/s"

    bool operator==(const ProgressSample&) const = default;
};

/// Разбирает одну строку вывода `aws s3 cp`:
///   Completed <size>/<size> (<size>/s) with N file(s) remaining
/// где <size> = "<число> <единица>", единицы B/KiB/MiB/GiB/TiB и KB/MB/GB/TB.
/// Строки другого вида (диагностика, пустые) дают nullopt, это не ошибка.
[[nodiscard]] auto parse_progress(std::string_view line) -> std::optional<ProgressSample>;

/// "256.0 KiB" -> 262144. Нераспознанная строка -> 0.
[[nodiscard]] auto convert_to_bytes(std::string_view size_text) -> std::uint64_t;

[[nodiscard]] auto try_convert_to_bytes(std::string_view size_text) -> std::optional<std::uint64_t>;

// Деление на 1024 с подписями B/KB/MB/GB/TB/PB, один знак после запятой.
// Именно в таком виде размер печатался всегда, не "исправлять" на KiB.
[[nodiscard]] auto format_size(std::uint64_t bytes) -> std::string;

// Пустая строка, если скорость неизвестна или нулевая
[[nodiscard]] auto estimate_eta(std::uint64_t remaining_bytes, double bytes_per_second) -> std::string;

[[nodiscard]] auto render_progress_bar(std::uint64_t completed,
                                       std::uint64_t total,
                                       std::string_view speed_label,
                                       std::optional<double> bytes_per_second = std::nullopt,
                                       int width = 40) -> std::string;

} // namespace gtxfer::core::progress
