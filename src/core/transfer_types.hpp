#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gtxfer::core {

enum class OperationKind {
    Upload,
    Download,
};

enum class FileStatus {
    Pending,
    InProgress,
    Completed,
    Failed,
};

// Один файл для передачи. source/target: локальный путь или s3:// URI
struct TransferItem {
    std::string source;
    std::string target;
    std::optional<std::uint64_t> size;

    bool operator==(const TransferItem&) const = default;
};

struct FileRecord {
    std::string path;      // = TransferItem::source
    std::string target;
    std::string filename;
    std::uint64_t size = 0;
    FileStatus status = FileStatus::Pending;
    int attempts = 0;
    std::optional<std::string> last_error;
    std::optional<std::string> checksum;

    bool operator==(const FileRecord&) const = default;
};

struct OperationState {
    std::string session_id;
    OperationKind operation = OperationKind::Upload;
    std::string started_at;
    std::string updated_at;
    std::string destination;
    std::vector<FileRecord> files;

    bool operator==(const OperationState&) const = default;
};

[[nodiscard]] auto to_string(OperationKind kind) -> std::string_view;
[[nodiscard]] auto to_string(FileStatus status) -> std::string_view;

// Неизвестные значения -> nullopt (checkpoint с таким полем отбрасывается)
[[nodiscard]] auto parse_operation_kind(std::string_view text) -> std::optional<OperationKind>;
[[nodiscard]] auto parse_file_status(std::string_view text) -> std::optional<FileStatus>;

// ISO-8601, UTC, секундная точность: 2025-01-15T10:30:45Z
[[nodiscard]] auto utc_timestamp() -> std::string;

[[nodiscard]] auto to_transfer_item(const FileRecord& record) -> TransferItem;

} // namespace gtxfer::core
