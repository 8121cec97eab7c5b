#include "parser/block_segmenter.hpp"
#include "core/utils.hpp"

#include <format>
#include <optional>
#include <utility>

namespace wgpeers {

static constexpr char kSectionStart = '[';

std::vector<Block> BlockSegmenter::segment(std::string_view text) {
    std::vector<Block> blocks;
    std::optional<Block> current;

    for (const auto line : utils::split_lines(text)) {
        if (!line.empty() && line.front() == kSectionStart) {
            if (current) {
                blocks.emplace_back(std::move(*current));
                current.reset();
            }
            if (line == kPeerHeader) {
                current.emplace();
            }
            continue;
        }

        if (current && !line.empty()) {
            current->push_back(line);
        }
    }

    // Trailing [Peer] section with no header after it
    if (current) {
        blocks.emplace_back(std::move(*current));
    }

    utils::log::debug(std::format("BlockSegmenter: {} [Peer] block(s)", blocks.size()));
    return blocks;
}

} // namespace wgpeers
