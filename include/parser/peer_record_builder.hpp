#pragma once

#include "core/types.hpp"
#include "parser/peer_error.hpp"

#include <cstddef>
#include <string_view>
#include <utility>

namespace wgpeers {

/**
 * @brief Turns one [Peer] block into a PeerRecord
 *
 * Lines are scanned once, in order:
 * - "publickey..." (any case)  -> public_key = text after first '=', trimmed
 * - "allowedips..." (any case) -> allowed_ips = text after first '=', trimmed
 * - trimmed line starting '#'  -> "# friendly_name = x" sets name
 * - anything else is ignored
 *
 * Repeated keys overwrite: the last matching line wins. Only the key name is
 * case-insensitive, values are copied as written.
 */
class PeerRecordBuilder {
public:
    static constexpr std::string_view kPublicKeyPrefix = "publickey";
    static constexpr std::string_view kAllowedIpsPrefix = "allowedips";

    /**
     * @brief Build result
     */
    struct BuildResult {
        bool success = false;
        PeerRecord record;
        BlockError error;

        static BuildResult ok(PeerRecord record) {
            BuildResult result;
            result.success = true;
            result.record = std::move(record);
            return result;
        }

        static BuildResult error_from(BlockError err) {
            BuildResult result;
            result.success = false;
            result.error = std::move(err);
            return result;
        }
    };

    /**
     * @brief Build a record from a block
     * @param block Non-blank lines of one [Peer] section
     * @param block_index Position of the block, reported in errors
     * @return Record, or PUBLIC_KEY_NOT_FOUND / ALLOWED_IPS_ENTRY_NOT_FOUND
     *         carrying copies of the block's lines
     */
    [[nodiscard]] static BuildResult build(const Block& block, size_t block_index = 0);
};

} // namespace wgpeers
