#include "transfer_types.hpp"
#include <chrono>
#include <ctime>
#include <fmt/chrono.h>
#include <fmt/core.h>

namespace gtxfer::core {

auto to_string(OperationKind kind) -> std::string_view {
    switch (kind) {
        case OperationKind::Upload:   return "upload";
        case OperationKind::Download: return "download";
    }
    return "upload";
}

auto to_string(FileStatus status) -> std::string_view {
    switch (status) {
        case FileStatus::Pending:    return "pending";
        case FileStatus::InProgress: return "in_progress";
        case FileStatus::Completed:  return "completed";
        case FileStatus::Failed:     return "failed";
    }
    return "pending";
}

auto parse_operation_kind(std::string_view text) -> std::optional<OperationKind> {
    if (text == "upload") return OperationKind::Upload;
    if (text == "download") return OperationKind::Download;
    return std::nullopt;
}

auto parse_file_status(std::string_view text) -> std::optional<FileStatus> {
    if (text == "pending") return FileStatus::Pending;
    if (text == "in_progress") return FileStatus::InProgress;
    if (text == "completed") return FileStatus::Completed;
    if (text == "failed") return FileStatus::Failed;
    return std::nullopt;
}

auto utc_timestamp() -> std::string {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(now));
}

auto to_transfer_item(const FileRecord& record) -> TransferItem {
    return TransferItem{
        .source = record.path,
        .target = record.target,
        .size = record.size,
    };
}

} // namespace gtxfer::core
