#pragma once

#include "error_handler/error.hpp"
#include <chrono>
#include <functional>
#include <optional>

namespace gtxfer::infra {
/*

auto outcome = infra::attempt_with_retry(
    [&] { return cli.copy(src, dst, on_line); },
    [&] { return verify_size(item); },
    infra::RetryPolicy{ .max_attempts = 5 });

*/
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds initial_delay = std::chrono::seconds(1);
    std::chrono::milliseconds max_delay = std::chrono::seconds(60);
    double backoff_factor = 2.0; // exponential backoff
};

enum class RetryState {
    NotStarted,
    Attempting,
    Verifying,
    Succeeded,
    Exhausted,
};

struct RetryOutcome {
    RetryState state = RetryState::NotStarted;
    int attempts = 0;
    std::optional<Error> last_error;

    [[nodiscard]] auto succeeded() const -> bool { return state == RetryState::Succeeded; }
};

using AttemptFn = std::function<VoidResult()>;
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// Задержка перед следующей попыткой после неудачной попытки `attempt` (1-based):
// min(initial_delay * factor^(attempt-1), max_delay)
[[nodiscard]] auto backoff_delay(const RetryPolicy& policy, int attempt)
    -> std::chrono::milliseconds;

[[nodiscard]] auto default_sleeper() -> Sleeper;

/// Выполняет execute_once до policy.max_attempts раз.
/// Если передан verify, успешная попытка считается успешной только после
/// проверки; провал проверки расходует попытку так же, как провал передачи.
/// Ошибки, для которых is_transient() == false, не повторяются.
/// После прерывания (SIGINT) новые попытки не запускаются.
[[nodiscard]] auto attempt_with_retry(const AttemptFn& execute_once,
                                      const AttemptFn& verify,
                                      const RetryPolicy& policy,
                                      const Sleeper& sleep = default_sleeper())
    -> RetryOutcome;

} // namespace gtxfer::infra
