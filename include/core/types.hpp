#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <optional>

namespace wgpeers {

// ============================================================================
// Basic Enums
// ============================================================================

/**
 * @brief How the record collection reacts to a failing [Peer] block
 */
enum class ParseMode {
    FAIL_FAST,      // Stop at the first failing block
    COLLECT_ALL     // Visit every block, report every failure
};

inline constexpr const char* parse_mode_name(ParseMode mode) {
    switch (mode) {
        case ParseMode::FAIL_FAST:   return "fail_fast";
        case ParseMode::COLLECT_ALL: return "collect_all";
    }
    return "unknown";
}

// ============================================================================
// Peer Record
// ============================================================================

/**
 * @brief One [Peer] section of a WireGuard configuration
 *
 * Only built once both public_key and allowed_ips are non-empty.
 * All fields are owned copies, independent of the parsed text.
 */
struct PeerRecord {
    std::string public_key;
    std::string allowed_ips;
    std::optional<std::string> name;    // From "# friendly_name = ..." metadata

    bool operator==(const PeerRecord&) const = default;
};

// Record collection, keyed by public key
using PeerMap = std::unordered_map<std::string, PeerRecord>;

// Non-blank lines of one [Peer] section, borrowed from the input text
using Block = std::vector<std::string_view>;

} // namespace wgpeers
