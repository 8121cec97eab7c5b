#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace wgpeers {

/**
 * @brief Why a [Peer] block could not become a PeerRecord
 */
enum class PeerErrorCode {
    SUCCESS = 0,
    PUBLIC_KEY_NOT_FOUND,
    ALLOWED_IPS_ENTRY_NOT_FOUND
};

/**
 * @brief Stable name of an error code ("PublicKeyNotFound", ...)
 */
const char* peer_error_name(PeerErrorCode code);

/**
 * @brief Failure of a single [Peer] block
 *
 * Carries owned copies of the block's lines so the diagnostic outlives the
 * parsed text.
 */
struct BlockError {
    PeerErrorCode code = PeerErrorCode::SUCCESS;
    size_t block_index = 0;             // 0-based position among [Peer] blocks
    std::vector<std::string> lines;

    static BlockError from_block(PeerErrorCode code, const Block& block, size_t block_index);

    /**
     * @brief One-line rendering, e.g.
     *   PublicKeyNotFound { lines: ["# friendly_name = laptop", "AllowedIPs = 10.0.0.3/32"] }
     */
    [[nodiscard]] std::string describe() const;

    bool operator==(const BlockError&) const = default;
};

} // namespace wgpeers
