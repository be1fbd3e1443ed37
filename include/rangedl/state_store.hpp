#pragma once

#include "chunk_info.hpp"

#include <filesystem>
#include <optional>

namespace rangedl {

// Durable TransferState snapshot kept beside the target file as
// <target>.partinfo, with chunk files under <target>.parts/.
class StateStore {
public:
    explicit StateStore(const std::filesystem::path& target_file);

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    // Missing, unreadable or corrupt state yields nullopt.
    [[nodiscard]] std::optional<TransferState> load() const;

    // Writes through a temporary sibling and renames it into place.
    bool save(const TransferState& state) const;

    void remove() const;

    [[nodiscard]] static std::filesystem::path statePathFor(const std::filesystem::path& target_file);
    [[nodiscard]] static std::filesystem::path tempDirFor(const std::filesystem::path& target_file);

private:
    std::filesystem::path path_;
};

} // namespace rangedl
