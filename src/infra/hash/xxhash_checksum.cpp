#include "xxhash_checksum.hpp"
#include <fstream>
#include <memory>
#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gtxfer::infra {

auto XXHashChecksum::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::NotFound,
                                         fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    std::unique_ptr<XXH64_state_t, decltype(&XXH64_freeState)> state(XXH64_createState(), &XXH64_freeState);
    if (!state) {
        return std::unexpected(make_error(ErrorCode::Unknown, "Failed to create XXH64 state"));
    }

    XXH64_reset(state.get(), 0); // seed = 0

    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        XXH64_update(state.get(), buffer.data(), static_cast<size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::Unknown,
                                         fmt::format("Error reading file: {}", path.string())));
    }

    return XXH64_digest(state.get());
}

auto XXHashChecksum::checksum_string(const std::filesystem::path& path)
    -> std::expected<std::string, Error>
{
    auto hash = hash_file(path);
    if (!hash) {
        return std::unexpected(std::move(hash.error()));
    }
    spdlog::debug("xxh64 {} = {:016x}", path.string(), *hash);
    return fmt::format("xxh64:{:016x}", *hash);
}

} // namespace gtxfer::infra
