#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include "../../core/progress/progress_parser.hpp"

namespace gtxfer::infra {

/// Живой индикатор для одного элемента батча. Перерисовывается на каждую
/// строку вывода инструмента; последняя разобранная выборка сохраняется,
/// чтобы индикатор не пустел на строках без прогресса.
class ProgressMonitor {
public:
    struct Stats {
        std::size_t total_items = 0;
        std::size_t current_item = 0;
        std::uint64_t lines_seen = 0;
        std::uint64_t samples_parsed = 0;
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_total(std::size_t items);
    void begin_item(std::size_t index, std::string_view name);
    void on_line(std::string_view line);
    void end_item();

    [[nodiscard]] auto last_sample() const -> const std::optional<core::progress::ProgressSample>& {
        return last_sample_;
    }
    [[nodiscard]] auto get_stats() const -> Stats { return stats_; }
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    void render_() const;
    void clear_line_() const;

    const bool enabled_;
    const bool quiet_;
    Stats stats_{};
    std::string current_name_;
    std::optional<core::progress::ProgressSample> last_sample_;
    mutable bool line_dirty_ = false;
};

} // namespace gtxfer::infra
