#pragma once

#include "core/types.hpp"
#include "parser/peer_error.hpp"

#include <cassert>
#include <string_view>
#include <utility>
#include <vector>

namespace wgpeers {

/**
 * @brief WireGuard configuration -> record collection
 *
 * Pipeline: text -> BlockSegmenter -> PeerRecordBuilder per block -> PeerMap.
 *
 * Records are keyed by public key. A later block with the same public key
 * replaces the earlier record; collisions are not errors.
 *
 * Modes:
 * - FAIL_FAST (default): the first failing block aborts the parse. errors
 *   holds that single failure and peers is empty.
 * - COLLECT_ALL: every block is built; every failure is reported in input
 *   order. The result is still a failure if any block failed, and peers holds
 *   the blocks that did build.
 *
 * Thread-safety: stateless, safe for concurrent use. Nothing in the result
 * refers to the input text.
 */
class PeerConfigParser {
public:
    /**
     * @brief Parse result
     */
    struct ParseResult {
        bool success = false;
        PeerMap peers;
        std::vector<BlockError> errors;

        static ParseResult ok(PeerMap peers) {
            ParseResult result;
            result.success = true;
            result.peers = std::move(peers);
            return result;
        }

        static ParseResult error(std::vector<BlockError> errors, PeerMap partial = {}) {
            ParseResult result;
            result.success = false;
            result.errors = std::move(errors);
            result.peers = std::move(partial);
            return result;
        }

        // First failure in input order. Precondition: !success
        const BlockError& first_error() const {
            assert(!errors.empty());
            return errors.front();
        }
    };

    /**
     * @brief Parse WireGuard configuration text
     * @param text Full configuration text
     * @param mode Failure policy
     */
    [[nodiscard]] static ParseResult parse(std::string_view text,
                                           ParseMode mode = ParseMode::FAIL_FAST);

    /**
     * @brief Build the collection from already segmented blocks
     */
    [[nodiscard]] static ParseResult collect(const std::vector<Block>& blocks,
                                             ParseMode mode = ParseMode::FAIL_FAST);
};

} // namespace wgpeers
