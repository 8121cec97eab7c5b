#include "parser/peer_config_parser.hpp"
#include "parser/block_segmenter.hpp"
#include "parser/peer_record_builder.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>

namespace wgpeers {

PeerConfigParser::ParseResult PeerConfigParser::parse(std::string_view text, ParseMode mode) {
    return collect(BlockSegmenter::segment(text), mode);
}

PeerConfigParser::ParseResult PeerConfigParser::collect(const std::vector<Block>& blocks,
                                                        ParseMode mode) {
    PeerMap peers;
    peers.reserve(blocks.size());
    std::vector<BlockError> errors;

    for (size_t i = 0; i < blocks.size(); ++i) {
        auto built = PeerRecordBuilder::build(blocks[i], i);

        if (!built.success) {
            utils::log::debug(std::format("PeerConfigParser: block {} failed: {}",
                                          i, built.error.describe()));
            errors.push_back(std::move(built.error));
            if (mode == ParseMode::FAIL_FAST) {
                return ParseResult::error(std::move(errors));
            }
            continue;
        }

        // Last block wins on a duplicate public key
        auto key = built.record.public_key;
        peers.insert_or_assign(std::move(key), std::move(built.record));
    }

    if (!errors.empty()) {
        utils::log::debug(std::format("PeerConfigParser: {} of {} block(s) failed ({})",
                                      errors.size(), blocks.size(), parse_mode_name(mode)));
        return ParseResult::error(std::move(errors), std::move(peers));
    }

    utils::log::debug(std::format("PeerConfigParser: {} peer(s) from {} block(s)",
                                  peers.size(), blocks.size()));
    return ParseResult::ok(std::move(peers));
}

} // namespace wgpeers
