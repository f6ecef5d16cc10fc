#include "batch_orchestrator.hpp"
#include <algorithm>
#include <unordered_set>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "../../infra/hash/xxhash_checksum.hpp"
#include "../../infra/interrupt.hpp"

namespace gtxfer::core {

namespace {

auto local_path_of(const TransferItem& item, OperationKind kind) -> std::filesystem::path {
    return kind == OperationKind::Upload ? item.source : item.target;
}

auto capitalized(OperationKind kind) -> std::string_view {
    return kind == OperationKind::Upload ? "Upload" : "Download";
}

auto progressive(OperationKind kind) -> std::string_view {
    return kind == OperationKind::Upload ? "Uploading" : "Downloading";
}

} // namespace

BatchOrchestrator::BatchOrchestrator(const extensions::CheckpointStore& store,
                                     infra::ProgressMonitor& monitor,
                                     BatchOptions options)
    : store_(store), monitor_(monitor), options_(std::move(options)) {}

auto BatchOrchestrator::prepare_state(OperationKind kind,
                                      const std::vector<TransferItem>& items,
                                      const std::string& destination) const
    -> std::pair<OperationState, bool>
{
    auto previous = store_.load();

    if (previous && options_.resume) {
        if (previous->destination == destination && previous->operation == kind) {
            spdlog::info("Resuming session {} (started {})", previous->session_id, previous->started_at);

            // Новые элементы, которых не было в checkpoint, дописываются в конец
            std::unordered_set<std::string> known;
            for (const auto& record : previous->files) {
                known.insert(record.path);
            }
            std::vector<TransferItem> fresh;
            for (const auto& item : items) {
                if (!known.contains(item.source)) {
                    fresh.push_back(item);
                }
            }
            if (!fresh.empty()) {
                auto extra = store_.create(kind, destination, fresh).files;
                previous->files.insert(previous->files.end(), extra.begin(), extra.end());
            }
            return {std::move(*previous), true};
        }
        spdlog::warn("Saved state is for {} {}, not {} {}; starting fresh",
                     to_string(previous->operation), previous->destination,
                     to_string(kind), destination);
    } else if (previous) {
        spdlog::info("Discarding saved state of session {} (resume not requested)", previous->session_id);
    }

    return {store_.create(kind, destination, items), false};
}

void BatchOrchestrator::persist(OperationState& state) const {
    auto res = store_.save(state);
    if (!res) {
        // Батч продолжается; возобновление с этого шага не гарантировано
        (void)infra::log_and_return(std::move(res.error()));
    }
}

auto BatchOrchestrator::transfer_record(OperationState state,
                                        std::size_t index,
                                        const TransferFn& transfer) const
    -> OperationState
{
    const auto item = to_transfer_item(state.files[index]);

    state.files[index].status = FileStatus::InProgress;
    persist(state);

    infra::AttemptFn verify;
    if (options_.verify) {
        verify = [&] {
            return extensions::verify_item(item, state.operation, options_.remote_size);
        };
    }

    const auto outcome = infra::attempt_with_retry(
        [&] { return transfer(item); }, verify, options_.retry, options_.sleeper);

    auto& record = state.files[index];
    record.attempts = outcome.attempts;

    if (outcome.succeeded()) {
        // Запись после факта: completed только после exit 0 и проверки
        record.status = FileStatus::Completed;
        record.last_error.reset();
        if (options_.checksum) {
            auto sum = infra::XXHashChecksum::checksum_string(local_path_of(item, state.operation));
            if (sum) {
                record.checksum = std::move(*sum);
            } else {
                spdlog::warn("Checksum skipped for {}: {}", record.filename, sum.error().message);
            }
        }
        spdlog::info("✓ {} ({} attempt(s))", record.filename, record.attempts);
    } else if (infra::is_interrupted()) {
        // Прерванный элемент будет повторён при --resume
        record.status = FileStatus::Pending;
        record.last_error = "Interrupted";
        spdlog::warn("Interrupted while transferring {}", record.filename);
    } else {
        record.status = FileStatus::Failed;
        record.last_error = outcome.last_error
            ? fmt::format("{} after {} attempt(s): {}",
                          infra::error_code_name(infra::ErrorCode::RetryExhausted),
                          outcome.attempts, outcome.last_error->message)
            : fmt::format("Failed after {} attempt(s)", outcome.attempts);
        spdlog::error("✗ {}: {}", record.filename, *record.last_error);
    }

    persist(state);
    return state;
}

auto BatchOrchestrator::run(OperationKind kind,
                            const std::vector<TransferItem>& items,
                            const std::string& destination,
                            const TransferFn& transfer) const
    -> infra::Result<BatchSummary>
{
    if (!transfer) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "No transfer function supplied"));
    }
    if (options_.verify && !options_.remote_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "Verification requested without a remote size provider"));
    }

    auto [state, resumed] = prepare_state(kind, items, destination);

    BatchSummary summary;
    summary.session_id = state.session_id;
    summary.resumed = resumed;

    const auto total = state.files.size();
    monitor_.set_total(total);
    spdlog::info("{} batch: {} file(s), remote {}", capitalized(kind), total, destination);

    if (total > 0) {
        persist(state);
    }

    std::vector<bool> skipped(total, false);
    bool interrupted = false;
    for (std::size_t i = 0; i < total; ++i) {
        if (state.files[i].status == FileStatus::Completed) {
            spdlog::info("[{}/{}] Skipping {} (already completed)", i + 1, total, state.files[i].filename);
            skipped[i] = true;
            continue;
        }
        if (infra::is_interrupted()) {
            interrupted = true;
            break;
        }

        spdlog::info("[{}/{}] {}: {}", i + 1, total, progressive(kind), state.files[i].filename);
        monitor_.begin_item(i + 1, state.files[i].filename);
        state = transfer_record(std::move(state), i, transfer);
        monitor_.end_item();

        if (infra::is_interrupted()) {
            interrupted = true;
            break;
        }
    }

    // Прерывание после последнего успешного элемента не оставляет работы для --resume
    if (interrupted && std::ranges::all_of(state.files, [](const FileRecord& r) {
            return r.status == FileStatus::Completed;
        })) {
        spdlog::info("Interrupt received after the last item completed");
        interrupted = false;
    }

    if (interrupted) {
        persist(state);
        return std::unexpected(infra::make_error(infra::ErrorCode::Interrupted,
            fmt::format("Interrupted; state saved to {} (use --resume)", store_.path().string())));
    }

    // Возобновлённые completed входят в success_count и отдельно в skipped_count
    for (std::size_t i = 0; i < total; ++i) {
        const auto& record = state.files[i];
        ItemOutcome outcome{
            .filename = record.filename,
            .source = record.path,
            .target = record.target,
            .status = record.status,
            .attempts = record.attempts,
            .error = record.last_error,
            .skipped = skipped[i],
        };
        if (record.status == FileStatus::Completed) {
            ++summary.success_count;
            if (skipped[i]) ++summary.skipped_count;
        } else {
            ++summary.failure_count;
            summary.failed_items.push_back(record.filename);
        }
        summary.outcomes.push_back(std::move(outcome));
    }

    if (summary.failure_count == 0) {
        auto res = store_.clear();
        if (!res) {
            (void)infra::log_and_return(std::move(res.error()));
        }
    } else {
        spdlog::warn("{} file(s) failed; state kept at {} for --resume",
                     summary.failure_count, store_.path().string());
    }

    return summary;
}

auto render_summary(const BatchSummary& summary, OperationKind kind) -> std::string
{
    const std::string rule(70, '=');
    const auto total = summary.total();

    std::string out;
    out += fmt::format("{}\nBatch {} Summary\n{}\n", rule, capitalized(kind), rule);
    out += fmt::format("✅ Successful: {}/{}\n", summary.success_count, total);
    if (summary.skipped_count > 0) {
        out += fmt::format("⏭  Already completed: {}\n", summary.skipped_count);
    }
    out += fmt::format("❌ Failed: {}/{}\n", summary.failure_count, total);

    if (!summary.failed_items.empty()) {
        out += "\nFailed files:\n";
        for (const auto& name : summary.failed_items) {
            out += fmt::format("  - {}\n", name);
        }
    }
    out += rule;
    out += '\n';
    return out;
}

} // namespace gtxfer::core
