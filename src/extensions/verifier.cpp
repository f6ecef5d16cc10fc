// verifier.cpp
#include "verifier.hpp"
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gtxfer::extensions {

auto verify_sizes(const std::filesystem::path& local,
                  const std::string& remote,
                  const RemoteSizeFn& remote_size) -> infra::VoidResult
{
    std::error_code ec;
    const auto local_size = std::filesystem::file_size(local, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::VerificationMismatch,
            fmt::format("Cannot stat {}: {}", local.string(), ec.message())));
    }

    if (!remote_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "No remote size provider for verification"));
    }

    auto remote_bytes = remote_size(remote);
    if (!remote_bytes) {
        return std::unexpected(infra::make_error(infra::ErrorCode::VerificationMismatch,
            fmt::format("Verification failed for {}: {}", remote, remote_bytes.error().message)));
    }

    if (*remote_bytes != local_size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::VerificationMismatch,
            fmt::format("Size mismatch for {}: local {} bytes, remote {} bytes",
                        remote, local_size, *remote_bytes)));
    }

    spdlog::debug("Verified {} ({} bytes)", remote, local_size);
    return {};
}

auto verify_item(const core::TransferItem& item,
                 core::OperationKind kind,
                 const RemoteSizeFn& remote_size) -> infra::VoidResult
{
    if (kind == core::OperationKind::Upload) {
        return verify_sizes(item.source, item.target, remote_size);
    }
    return verify_sizes(item.target, item.source, remote_size);
}

} // namespace gtxfer::extensions
