// src/extensions/checkpoint_store.hpp
#pragma once

#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>
#include "../core/transfer_types.hpp"
#include "../infra/error_handler/error.hpp"

namespace gtxfer::extensions {

/// Файл checkpoint существует, пока операция не завершилась полностью успешно.
/// Формат: JSON-совместимый документ (строки в двойных кавычках, отсутствующие
/// необязательные поля не пишутся). Хранилище не владеет состоянием между
/// вызовами, только путём к файлу.
class CheckpointStore {
public:
    explicit CheckpointStore(std::filesystem::path path = default_checkpoint_path());

    [[nodiscard]] auto create(core::OperationKind kind,
                              std::string_view destination,
                              const std::vector<core::TransferItem>& items) const
        -> core::OperationState;

    // Повреждённый или непонятный файл трактуется как отсутствующий
    [[nodiscard]] auto load() const -> std::optional<core::OperationState>;

    // Обновляет state.updated_at и атомарно (tmp + rename) перезаписывает файл
    [[nodiscard]] auto save(core::OperationState& state) const -> infra::VoidResult;

    [[nodiscard]] auto clear() const -> infra::VoidResult;

    [[nodiscard]] auto exists() const -> bool;
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    [[nodiscard]] static auto default_checkpoint_path() -> std::filesystem::path;

private:
    std::filesystem::path path_;
};

[[nodiscard]] auto serialize_state(const core::OperationState& state) -> std::string;

[[nodiscard]] auto deserialize_state(std::string_view text) -> infra::Result<core::OperationState>;

} // namespace gtxfer::extensions
