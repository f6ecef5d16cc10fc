#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <expected>
#include "../transfer_types.hpp"
#include "../../extensions/checkpoint_store.hpp"
#include "../../extensions/verifier.hpp"
#include "../../infra/error_handler/error.hpp"
#include "../../infra/monitoring/monitoring.hpp"
#include "../../infra/retry.hpp"

namespace gtxfer::core {

struct ItemOutcome {
    std::string filename;
    std::string source;
    std::string target;
    FileStatus status = FileStatus::Pending;
    int attempts = 0;
    std::optional<std::string> error;
    bool skipped = false; // уже был completed в возобновлённом checkpoint
};

struct BatchSummary {
    std::string session_id;
    bool resumed = false;
    std::size_t success_count = 0;
    std::size_t failure_count = 0;
    std::size_t skipped_count = 0;
    std::vector<ItemOutcome> outcomes;
    std::vector<std::string> failed_items;

    [[nodiscard]] auto total() const -> std::size_t { return outcomes.size(); }
};

// Одна попытка передачи одного элемента (обычно S3Cli::copy)
using TransferFn = std::function<infra::VoidResult(const TransferItem&)>;

struct BatchOptions {
    infra::RetryPolicy retry{};
    bool verify = false;
    bool checksum = false;
    bool resume = false;
    extensions::RemoteSizeFn remote_size;   // обязателен при verify
    infra::Sleeper sleeper = infra::default_sleeper();
};

class BatchOrchestrator {
public:
    BatchOrchestrator(const extensions::CheckpointStore& store,
                      infra::ProgressMonitor& monitor,
                      BatchOptions options);

    /// Выполняет батч последовательно. Ошибка элемента не останавливает батч.
    /// Checkpoint сохраняется после каждой смены статуса и удаляется, только
    /// если все элементы completed. Прерывание (SIGINT) -> Interrupted, текущая
    /// попытка доводится до конца, checkpoint остаётся для --resume.
    [[nodiscard]] auto run(OperationKind kind,
                           const std::vector<TransferItem>& items,
                           const std::string& destination,
                           const TransferFn& transfer) const
        -> infra::Result<BatchSummary>;

private:
    [[nodiscard]] auto prepare_state(OperationKind kind,
                                     const std::vector<TransferItem>& items,
                                     const std::string& destination) const
        -> std::pair<OperationState, bool>;

    // Шаг батча: состояние передаётся по значению и возвращается обновлённым
    [[nodiscard]] auto transfer_record(OperationState state,
                                       std::size_t index,
                                       const TransferFn& transfer) const
        -> OperationState;

    void persist(OperationState& state) const;

    const extensions::CheckpointStore& store_;
    infra::ProgressMonitor& monitor_;
    BatchOptions options_;
};

[[nodiscard]] auto render_summary(const BatchSummary& summary, OperationKind kind) -> std::string;

} // namespace gtxfer::core
