#pragma once

#include "types/Rule.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace sm::types {

// One resolved file-level transfer.
//
// Export: source_path is the absolute plaintext path, endpoint_path is the
// ciphertext path relative to the export destination ("<dir>/<file>.age").
// Import: source_path is the ciphertext path relative to the export tree,
// endpoint_path is the absolute plaintext path.
struct Operation {
    std::filesystem::path source_path;
    std::filesystem::path endpoint_path;
    Direction action = Direction::Export;
    std::optional<std::filesystem::path> symlink_target;
    std::string profile; // profile group the rule came from ("shared" or the host)

    bool operator==(const Operation&) const = default;
};

// Suffix carried by every ciphertext artefact.
inline constexpr auto CIPHERTEXT_EXTENSION = ".age";

}
