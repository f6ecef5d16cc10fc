// checkpoint_store.cpp
#include "checkpoint_store.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <xxhash.h>
#include <yaml-cpp/yaml.h>

namespace gtxfer::extensions {

namespace {

auto make_session_id(core::OperationKind kind,
                     std::string_view destination,
                     std::string_view started_at) -> std::string
{
    // Наносекунды делают id уникальным для двух запусков в одну секунду
    const auto ticks = std::chrono::system_clock::now().time_since_epoch().count();
    const auto seed = fmt::format("{}|{}|{}|{}", core::to_string(kind), destination, started_at, ticks);
    return fmt::format("{}-{:016x}", core::to_string(kind), XXH64(seed.data(), seed.size(), 0));
}

auto emit_record(YAML::Emitter& out, const core::FileRecord& record) -> void {
    out << YAML::BeginMap;
    out << YAML::Key << "path" << YAML::Value << record.path;
    out << YAML::Key << "target" << YAML::Value << record.target;
    out << YAML::Key << "filename" << YAML::Value << record.filename;
    out << YAML::Key << "size" << YAML::Value << record.size;
    out << YAML::Key << "status" << YAML::Value << std::string(core::to_string(record.status));
    out << YAML::Key << "attempts" << YAML::Value << record.attempts;
    if (record.last_error) {
        out << YAML::Key << "last_error" << YAML::Value << *record.last_error;
    }
    if (record.checksum) {
        out << YAML::Key << "checksum" << YAML::Value << *record.checksum;
    }
    out << YAML::EndMap;
}

auto optional_string(const YAML::Node& node) -> std::optional<std::string> {
    if (!node || node.IsNull()) return std::nullopt;
    return node.as<std::string>();
}

auto parse_record(const YAML::Node& node) -> infra::Result<core::FileRecord> {
    if (!node.IsMap()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "File record is not a map"));
    }

    auto status = core::parse_file_status(node["status"].as<std::string>());
    if (!status) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Unknown file status '{}'", node["status"].as<std::string>())));
    }

    core::FileRecord record{
        .path = node["path"].as<std::string>(),
        .target = node["target"] ? node["target"].as<std::string>() : std::string{},
        .filename = node["filename"].as<std::string>(),
        .size = node["size"].as<std::uint64_t>(),
        .status = *status,
        .attempts = node["attempts"].as<int>(),
        .last_error = optional_string(node["last_error"]),
        .checksum = optional_string(node["checksum"]),
    };
    return record;
}

} // namespace

CheckpointStore::CheckpointStore(std::filesystem::path path)
    : path_(std::move(path)) {}

auto CheckpointStore::default_checkpoint_path() -> std::filesystem::path {
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return std::filesystem::path(home) / ".gtxfer-state.json";
    }
    return ".gtxfer-state.json";
}

auto CheckpointStore::create(core::OperationKind kind,
                             std::string_view destination,
                             const std::vector<core::TransferItem>& items) const
    -> core::OperationState
{
    core::OperationState state;
    state.operation = kind;
    state.destination = std::string(destination);
    state.started_at = core::utc_timestamp();
    state.updated_at = state.started_at;
    state.session_id = make_session_id(kind, destination, state.started_at);

    state.files.reserve(items.size());
    for (const auto& item : items) {
        state.files.push_back(core::FileRecord{
            .path = item.source,
            .target = item.target,
            .filename = std::filesystem::path(item.source).filename().string(),
            .size = item.size.value_or(0),
        });
    }
    return state;
}

auto CheckpointStore::load() const -> std::optional<core::OperationState>
{
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs) {
        spdlog::warn("Cannot read checkpoint {}, ignoring it", path_.string());
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();

    auto state = deserialize_state(buffer.str());
    if (!state) {
        spdlog::warn("Ignoring damaged checkpoint {}: {}", path_.string(), state.error().message);
        return std::nullopt;
    }
    return std::move(*state);
}

auto CheckpointStore::save(core::OperationState& state) const -> infra::VoidResult
{
    state.updated_at = core::utc_timestamp();
    const auto text = serialize_state(state);

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CheckpointWriteFailed,
                fmt::format("Cannot create checkpoint directory {}: {}",
                            path_.parent_path().string(), ec.message())));
        }
    }

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CheckpointWriteFailed,
                fmt::format("Cannot open {} for writing", tmp.string())));
        }
        ofs << text << '\n';
        ofs.flush();
        if (!ofs) {
            return std::unexpected(infra::make_error(infra::ErrorCode::CheckpointWriteFailed,
                fmt::format("Write to {} failed", tmp.string())));
        }
    }

    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        return std::unexpected(infra::make_error(infra::ErrorCode::CheckpointWriteFailed,
            fmt::format("Cannot replace checkpoint {}: {}", path_.string(), ec.message())));
    }
    return {};
}

auto CheckpointStore::clear() const -> infra::VoidResult
{
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::CheckpointWriteFailed,
            fmt::format("Cannot remove checkpoint {}: {}", path_.string(), ec.message())));
    }
    return {};
}

auto CheckpointStore::exists() const -> bool {
    std::error_code ec;
    return std::filesystem::exists(path_, ec);
}

auto serialize_state(const core::OperationState& state) -> std::string
{
    YAML::Emitter out;
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetOutputCharset(YAML::EscapeAsJson);

    out << YAML::BeginMap;
    out << YAML::Key << "session_id" << YAML::Value << state.session_id;
    out << YAML::Key << "operation" << YAML::Value << std::string(core::to_string(state.operation));
    out << YAML::Key << "started_at" << YAML::Value << state.started_at;
    out << YAML::Key << "updated_at" << YAML::Value << state.updated_at;
    out << YAML::Key << "destination" << YAML::Value << state.destination;
    out << YAML::Key << "files" << YAML::Value << YAML::BeginSeq;
    for (const auto& record : state.files) {
        emit_record(out, record);
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    return out.c_str();
}

auto deserialize_state(std::string_view text) -> infra::Result<core::OperationState>
{
    try {
        YAML::Node node = YAML::Load(std::string(text));
        if (!node.IsMap()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                     "Checkpoint root is not an object"));
        }

        auto kind = core::parse_operation_kind(node["operation"].as<std::string>());
        if (!kind) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                fmt::format("Unknown operation '{}'", node["operation"].as<std::string>())));
        }

        core::OperationState state;
        state.session_id = node["session_id"].as<std::string>();
        state.operation = *kind;
        state.started_at = node["started_at"].as<std::string>();
        state.updated_at = node["updated_at"].as<std::string>();
        state.destination = node["destination"].as<std::string>();

        const auto files = node["files"];
        if (!files.IsSequence()) {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                     "Checkpoint 'files' is not a list"));
        }
        for (const auto& file : files) {
            auto record = parse_record(file);
            if (!record) {
                return std::unexpected(std::move(record.error()));
            }
            state.files.push_back(std::move(*record));
        }
        return state;
    } catch (const YAML::Exception& e) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
            fmt::format("Malformed checkpoint: {}", e.what())));
    }
}

} // namespace gtxfer::extensions
