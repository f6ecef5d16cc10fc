#pragma once

#include <atomic>
#include <csignal>

namespace gtxfer::infra {

extern std::atomic<bool> g_interrupted;

void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Сброс флага (новая операция в том же процессе, тесты)
inline void reset_interrupted() {
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace gtxfer::infra
