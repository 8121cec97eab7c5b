#pragma once

#include "core/types.hpp"

#include <string_view>
#include <vector>

namespace wgpeers {

/**
 * @brief Splits WireGuard configuration text into [Peer] blocks
 *
 * Single pass over the lines:
 * - A line starting with '[' closes the open block (if any)
 * - Exactly "[Peer]" opens a new block; any other header opens nothing,
 *   so [Interface] and unknown sections are skipped with their content
 * - Non-empty lines are appended to the open block; empty lines are dropped
 * - A block still open at end of input is kept
 *
 * A [Peer] header followed by nothing yields an empty block. Rejecting it is
 * the record builder's job.
 *
 * Returned views point into @p text; the text must outlive them.
 */
class BlockSegmenter {
public:
    static constexpr std::string_view kPeerHeader = "[Peer]";

    [[nodiscard]] static std::vector<Block> segment(std::string_view text);
};

} // namespace wgpeers
