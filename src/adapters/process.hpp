#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace gtxfer::adapters::process {

using LineCallback = std::function<void(std::string_view)>;

/// Запускает argv[0] (поиск по PATH), объединяя stdout и stderr в один поток.
/// Вывод режется на строки по '\n' и '\r' (aws cli перерисовывает строку
/// прогресса через '\r'); пустые строки не передаются.
/// Возвращает код завершения процесса; убитый сигналом процесс даёт 128 + signo.
/// Ошибки: SpawnFailed (pipe/fork/exec), Timeout (процесс убит по таймауту).
[[nodiscard]] auto run(const std::vector<std::string>& argv,
                       const LineCallback& on_line,
                       std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    -> infra::Result<int>;

// Для логов: аргументы через пробел, с кавычками там, где есть пробелы
[[nodiscard]] auto format_command(const std::vector<std::string>& argv) -> std::string;

} // namespace gtxfer::adapters::process
