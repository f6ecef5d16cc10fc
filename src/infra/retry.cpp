#include "retry.hpp"
#include "interrupt.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <thread>

namespace gtxfer::infra {

auto backoff_delay(const RetryPolicy& policy, int attempt) -> std::chrono::milliseconds
{
    if (attempt < 1) attempt = 1;

    const double scaled = static_cast<double>(policy.initial_delay.count()) *
                          std::pow(policy.backoff_factor, attempt - 1);
    const double cap = static_cast<double>(policy.max_delay.count());

    // Переполнение при большом attempt упирается в cap
    if (!std::isfinite(scaled) || scaled >= cap) {
        return policy.max_delay;
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(scaled));
}

auto default_sleeper() -> Sleeper {
    return [](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); };
}

auto attempt_with_retry(const AttemptFn& execute_once,
                        const AttemptFn& verify,
                        const RetryPolicy& policy,
                        const Sleeper& sleep)
    -> RetryOutcome
{
    RetryOutcome outcome;
    const int max_attempts = std::max(policy.max_attempts, 1);

    for (int attempt = 1; attempt <= max_attempts; ++attempt) {
        outcome.state = RetryState::Attempting;
        outcome.attempts = attempt;

        auto result = execute_once();
        if (result && verify) {
            outcome.state = RetryState::Verifying;
            result = verify();
        }

        if (result) {
            outcome.state = RetryState::Succeeded;
            outcome.last_error.reset();
            return outcome;
        }

        spdlog::warn("Attempt {}/{} failed: {}", attempt, max_attempts, result.error().message);
        outcome.last_error = std::move(result.error());

        if (attempt == max_attempts) {
            break;
        }

        // Повтор не исправит неверные аргументы или отсутствующий провайдер
        if (!outcome.last_error->is_transient()) {
            spdlog::warn("{} is not retryable", error_code_name(outcome.last_error->code));
            break;
        }

        if (is_interrupted()) {
            outcome.state = RetryState::Exhausted;
            outcome.last_error = make_error(ErrorCode::Interrupted,
                "Interrupted before retry");
            return outcome;
        }

        const auto delay = backoff_delay(policy, attempt);
        spdlog::info("Retrying in {} ms...", delay.count());
        if (sleep) {
            sleep(delay);
        }
    }

    outcome.state = RetryState::Exhausted;
    return outcome;
}

} // namespace gtxfer::infra
