#include "monitoring.hpp"
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <iostream>

namespace gtxfer::infra {

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , quiet_(quiet)
{}

ProgressMonitor::~ProgressMonitor() {
    clear_line_();
}

void ProgressMonitor::set_total(std::size_t items) {
    stats_.total_items = items;
}

void ProgressMonitor::begin_item(std::size_t index, std::string_view name) {
    stats_.current_item = index;
    current_name_ = std::string(name);
    last_sample_.reset();
}

void ProgressMonitor::on_line(std::string_view line) {
    ++stats_.lines_seen;

    if (auto sample = core::progress::parse_progress(line)) {
        ++stats_.samples_parsed;
        last_sample_ = std::move(*sample);
        render_();
        return;
    }

    // Диагностика инструмента ("upload: ... to s3://...", ошибки)
    clear_line_();
    if (!quiet_) {
        spdlog::info("    {}", line);
    }
    render_();
}

void ProgressMonitor::end_item() {
    clear_line_();
    current_name_.clear();
}

void ProgressMonitor::clear_line_() const {
    if (!line_dirty_) return;
    std::cout << "\r\033[K" << std::flush; // ANSI: очистить строку
    line_dirty_ = false;
}

void ProgressMonitor::render_() const {
    if (quiet_ || !enabled_ || !last_sample_) return;

    const auto& s = *last_sample_;
    auto bar = core::progress::render_progress_bar(
        s.completed_bytes, s.total_bytes, s.speed_label, s.bytes_per_second);
    if (bar.empty()) return;

    std::cout << "\r\033[K";
    fmt::print("[{}/{}] {} {}", stats_.current_item, stats_.total_items, current_name_, bar);
    std::cout << std::flush;
    line_dirty_ = true;
}

} // namespace gtxfer::infra
