#pragma once

#include "core/types.hpp"
#include "parser/peer_error.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace wgpeers {

/**
 * @brief Renders parse results for the wg_peers CLI
 *
 * Peers are always emitted sorted by public key so output is stable
 * regardless of hash map order.
 */
class PeerRenderer {
public:
    /**
     * @brief [{"public_key", "allowed_ips", "name"}...], name is null when absent
     */
    [[nodiscard]] static nlohmann::json to_json(const PeerMap& peers);

    /**
     * @brief [{"error", "block_index", "lines"}...] in input order
     */
    [[nodiscard]] static nlohmann::json to_json(const std::vector<BlockError>& errors);

    /**
     * @brief One "<public_key>\t<allowed_ips>\t<name or ->" line per peer
     */
    [[nodiscard]] static std::string to_text(const PeerMap& peers);

    /**
     * @brief One BlockError::describe() line per error, prefixed by block index
     */
    [[nodiscard]] static std::string to_text(const std::vector<BlockError>& errors);

private:
    static std::vector<const PeerRecord*> sorted(const PeerMap& peers);
};

} // namespace wgpeers
