#include "parser/peer_error.hpp"

namespace wgpeers {

namespace {

// Quote a line the way it is shown in diagnostics: "..." with \ and " escaped
void append_quoted(std::string& out, const std::string& line) {
    out += '"';
    for (const char c : line) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t"; break;
            default:   out += c;
        }
    }
    out += '"';
}

} // anonymous namespace

const char* peer_error_name(PeerErrorCode code) {
    switch (code) {
        case PeerErrorCode::SUCCESS:                     return "Success";
        case PeerErrorCode::PUBLIC_KEY_NOT_FOUND:        return "PublicKeyNotFound";
        case PeerErrorCode::ALLOWED_IPS_ENTRY_NOT_FOUND: return "AllowedIPsEntryNotFound";
    }
    return "Unknown";
}

BlockError BlockError::from_block(PeerErrorCode code, const Block& block, size_t block_index) {
    BlockError err;
    err.code = code;
    err.block_index = block_index;
    err.lines.reserve(block.size());
    for (const auto line : block) {
        err.lines.emplace_back(line);
    }
    return err;
}

std::string BlockError::describe() const {
    std::string out = peer_error_name(code);
    out += " { lines: [";
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += ", ";
        append_quoted(out, lines[i]);
    }
    out += "] }";
    return out;
}

} // namespace wgpeers
