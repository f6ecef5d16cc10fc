#pragma once

#include <filesystem>
#include <expected>
#include <string>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace gtxfer::infra {

class XXHashChecksum {
public:
    // xxHash64 содержимого файла
    static auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

    // То же, в виде "xxh64:<16 hex>" для записи в checkpoint
    static auto checksum_string(const std::filesystem::path& path)
        -> std::expected<std::string, Error>;

private:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace gtxfer::infra
