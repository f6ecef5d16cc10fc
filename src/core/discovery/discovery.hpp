#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace gtxfer::core::discovery {

struct Filters {
    std::vector<std::string> include_patterns; // пусто = всё, что не исключено
    std::vector<std::string> exclude_patterns;
};

/// Shell-glob: `*`, `?`, `[abc]`, `[!a-z]`. Не регулярные выражения.
/// `*` совпадает и с '/', поэтому "logs/*" подходит к относительному пути.
[[nodiscard]] auto glob_match(std::string_view pattern, std::string_view text) -> bool;

[[nodiscard]] auto matches_any(const std::vector<std::string>& patterns,
                               std::string_view filename,
                               std::string_view relative_path) -> bool;

/// Рекурсивный обход root. Каталоги, подходящие под exclude, отбрасываются до
/// спуска в них. Порядок детерминированный: записи каждого каталога
/// сортируются лексикографически. Символьные ссылки на каталоги не обходятся.
/// Ошибка DiscoveryFailed, если root не существует или не является каталогом.
[[nodiscard]] auto discover(const std::filesystem::path& root, const Filters& filters)
    -> infra::Result<std::vector<std::filesystem::path>>;

} // namespace gtxfer::core::discovery
