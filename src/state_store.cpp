#include "rangedl/state_store.hpp"

#include <fstream>
#include <system_error>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace rangedl {

void to_json(nlohmann::json& j, const ChunkInfo& chunk) {
    j = nlohmann::json{
        {"index", chunk.index},
        {"start", chunk.start},
        {"end", chunk.end},
        {"downloaded", chunk.downloaded},
        {"completed", chunk.completed},
    };
}

void from_json(const nlohmann::json& j, ChunkInfo& chunk) {
    j.at("index").get_to(chunk.index);
    j.at("start").get_to(chunk.start);
    j.at("end").get_to(chunk.end);
    chunk.downloaded = j.value("downloaded", std::uint64_t{0});
    chunk.completed = j.value("completed", false);
}

void to_json(nlohmann::json& j, const TransferState& state) {
    j = nlohmann::json{
        {"url", state.url},
        {"filepath", state.filepath},
        {"total_size", state.total_size},
        {"chunks", state.chunks},
        {"completed", state.completed},
        {"timestamp", state.timestamp},
    };
}

void from_json(const nlohmann::json& j, TransferState& state) {
    j.at("url").get_to(state.url);
    j.at("filepath").get_to(state.filepath);
    j.at("total_size").get_to(state.total_size);
    j.at("chunks").get_to(state.chunks);
    state.completed = j.value("completed", false);
    state.timestamp = j.value("timestamp", 0.0);
}

StateStore::StateStore(const std::filesystem::path& target_file)
    : path_(statePathFor(target_file)) {}

std::filesystem::path StateStore::statePathFor(const std::filesystem::path& target_file) {
    std::filesystem::path state = target_file;
    state += ".partinfo";
    return state;
}

std::filesystem::path StateStore::tempDirFor(const std::filesystem::path& target_file) {
    std::filesystem::path dir = target_file;
    dir += ".parts";
    return dir;
}

std::optional<TransferState> StateStore::load() const {
    std::ifstream in(path_);
    if (!in) {
        return std::nullopt;
    }

    try {
        const auto j = nlohmann::json::parse(in);
        auto state = j.get<TransferState>();
        if (state.chunks.empty()) {
            spdlog::warn("Ignoring state file {} without chunks", path_.string());
            return std::nullopt;
        }
        return state;
    } catch (const nlohmann::json::exception& ex) {
        spdlog::warn("Ignoring unreadable state file {}: {}", path_.string(), ex.what());
        return std::nullopt;
    }
}

bool StateStore::save(const TransferState& state) const {
    std::filesystem::path tmp = path_;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            spdlog::error("Cannot write state file {}", tmp.string());
            return false;
        }
        out << nlohmann::json(state).dump();
        out.flush();
        if (!out) {
            spdlog::error("Failed to write state file {}", tmp.string());
            return false;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        spdlog::error("Cannot replace state file {}: {}", path_.string(), ec.message());
        return false;
    }
    spdlog::debug("Saved transfer state {} ({} chunks)", path_.string(), state.chunks.size());
    return true;
}

void StateStore::remove() const {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        spdlog::warn("Cannot remove state file {}: {}", path_.string(), ec.message());
    }
}

} // namespace rangedl
