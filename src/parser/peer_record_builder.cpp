#include "parser/peer_record_builder.hpp"
#include "parser/comment_parser.hpp"
#include "core/utils.hpp"

#include <format>
#include <utility>
#include <optional>

namespace wgpeers {

static constexpr char kEquals = '=';
static constexpr char kPound = '#';

PeerRecordBuilder::BuildResult PeerRecordBuilder::build(const Block& block, size_t block_index) {
    std::string_view public_key;
    std::string_view allowed_ips;
    std::optional<std::string_view> name;

    for (const auto line : block) {
        if (utils::starts_with_ci(line, kPublicKeyPrefix)) {
            public_key = utils::trim(utils::after_char(line, kEquals));
        } else if (utils::starts_with_ci(line, kAllowedIpsPrefix)) {
            allowed_ips = utils::trim(utils::after_char(line, kEquals));
        } else if (const auto trimmed = utils::trim(line);
                   !trimmed.empty() && trimmed.front() == kPound) {
            const auto kv = CommentParser::key_value(trimmed);
            if (kv && kv->key == kFriendlyNameKey) {
                name = kv->value;
            }
        }
    }

    // Duplicate PublicKey/AllowedIPs lines are not rejected: WireGuard refuses
    // such a config on its own.
    if (public_key.empty()) {
        return BuildResult::error_from(
            BlockError::from_block(PeerErrorCode::PUBLIC_KEY_NOT_FOUND, block, block_index));
    }
    if (allowed_ips.empty()) {
        return BuildResult::error_from(
            BlockError::from_block(PeerErrorCode::ALLOWED_IPS_ENTRY_NOT_FOUND, block, block_index));
    }

    PeerRecord record;
    record.public_key = std::string(public_key);
    record.allowed_ips = std::string(allowed_ips);
    if (name) {
        record.name = std::string(*name);
    }

    utils::log::debug(std::format("PeerRecordBuilder: block {} -> public_key={} allowed_ips={} name={}",
        block_index, record.public_key, record.allowed_ips, record.name.value_or("<none>")));
    return BuildResult::ok(std::move(record));
}

} // namespace wgpeers
