// src/extensions/verifier.hpp
#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include "../core/transfer_types.hpp"
#include "../infra/error_handler/error.hpp"

namespace gtxfer::extensions {

// Размер удалённого объекта (обычно S3Cli::object_size)
using RemoteSizeFn = std::function<infra::Result<std::uint64_t>(const std::string& remote)>;

/// Проверка после передачи: размер объекта в бакете должен точно совпасть с
/// размером локального файла. Содержимое не сравнивается.
/// Отсутствие объекта или ошибка ls -> VerificationMismatch.
[[nodiscard]] auto verify_sizes(const std::filesystem::path& local,
                                const std::string& remote,
                                const RemoteSizeFn& remote_size) -> infra::VoidResult;

/// Для upload локальный файл - источник, для download - цель
[[nodiscard]] auto verify_item(const core::TransferItem& item,
                               core::OperationKind kind,
                               const RemoteSizeFn& remote_size) -> infra::VoidResult;

} // namespace gtxfer::extensions
