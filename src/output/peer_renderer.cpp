#include "output/peer_renderer.hpp"

#include <algorithm>
#include <format>
#include <utility>

namespace wgpeers {

static constexpr const char* kNoName = "-";

std::vector<const PeerRecord*> PeerRenderer::sorted(const PeerMap& peers) {
    std::vector<const PeerRecord*> out;
    out.reserve(peers.size());
    for (const auto& [key, record] : peers) {
        out.push_back(&record);
    }
    std::sort(out.begin(), out.end(), [](const PeerRecord* a, const PeerRecord* b) {
        return a->public_key < b->public_key;
    });
    return out;
}

nlohmann::json PeerRenderer::to_json(const PeerMap& peers) {
    auto arr = nlohmann::json::array();
    for (const auto* record : sorted(peers)) {
        nlohmann::json entry = {
            {"public_key", record->public_key},
            {"allowed_ips", record->allowed_ips},
            {"name", nullptr}
        };
        if (record->name) {
            entry["name"] = *record->name;
        }
        arr.push_back(std::move(entry));
    }
    return arr;
}

nlohmann::json PeerRenderer::to_json(const std::vector<BlockError>& errors) {
    auto arr = nlohmann::json::array();
    for (const auto& err : errors) {
        nlohmann::json entry = {
            {"error", peer_error_name(err.code)},
            {"block_index", err.block_index},
            {"lines", err.lines}
        };
        arr.push_back(std::move(entry));
    }
    return arr;
}

std::string PeerRenderer::to_text(const PeerMap& peers) {
    std::string out;
    for (const auto* record : sorted(peers)) {
        out += std::format("{}\t{}\t{}\n",
            record->public_key, record->allowed_ips, record->name.value_or(kNoName));
    }
    return out;
}

std::string PeerRenderer::to_text(const std::vector<BlockError>& errors) {
    std::string out;
    for (const auto& err : errors) {
        out += std::format("[Peer] #{}: {}\n", err.block_index, err.describe());
    }
    return out;
}

} // namespace wgpeers
