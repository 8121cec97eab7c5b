#include <catch2/catch_test_macros.hpp>
#include "output/peer_renderer.hpp"
#include "parser/peer_config_parser.hpp"

using namespace wgpeers;

namespace {

PeerMap sample_peers() {
    PeerMap peers;
    peers["ZZZ="] = PeerRecord{"ZZZ=", "10.0.0.3/32", std::nullopt};
    peers["AAA="] = PeerRecord{"AAA=", "10.0.0.1/32", std::string("laptop")};
    peers["MMM="] = PeerRecord{"MMM=", "10.0.0.2/32, fd00::2/128", std::string("")};
    return peers;
}

} // namespace

TEST_CASE("PeerRenderer JSON peers", "[output]") {
    const auto doc = PeerRenderer::to_json(sample_peers());
    REQUIRE(doc.is_array());
    REQUIRE(doc.size() == 3);

    SECTION("Sorted by public key") {
        CHECK(doc[0]["public_key"].get<std::string>() == "AAA=");
        CHECK(doc[1]["public_key"].get<std::string>() == "MMM=");
        CHECK(doc[2]["public_key"].get<std::string>() == "ZZZ=");
    }

    SECTION("Fields") {
        CHECK(doc[0]["allowed_ips"].get<std::string>() == "10.0.0.1/32");
        CHECK(doc[0]["name"].get<std::string>() == "laptop");
        CHECK(doc[1]["name"].get<std::string>() == "");
        CHECK(doc[2]["name"].is_null());
    }
}

TEST_CASE("PeerRenderer JSON empty collection", "[output]") {
    const auto doc = PeerRenderer::to_json(PeerMap{});
    CHECK(doc.is_array());
    CHECK(doc.empty());
    CHECK(doc.dump() == "[]");
}

TEST_CASE("PeerRenderer JSON errors", "[output]") {
    auto result = PeerConfigParser::parse(
        "[Peer]\n# friendly_name = x\nAllowedIPs = 10.0.0.1/32\n[Peer]\nPublicKey = B\n",
        ParseMode::COLLECT_ALL);
    REQUIRE_FALSE(result.success);

    const auto doc = PeerRenderer::to_json(result.errors);
    REQUIRE(doc.size() == 2);
    CHECK(doc[0]["error"].get<std::string>() == "PublicKeyNotFound");
    CHECK(doc[0]["block_index"].get<size_t>() == 0);
    REQUIRE(doc[0]["lines"].size() == 2);
    CHECK(doc[0]["lines"][0].get<std::string>() == "# friendly_name = x");
    CHECK(doc[1]["error"].get<std::string>() == "AllowedIPsEntryNotFound");
    CHECK(doc[1]["block_index"].get<size_t>() == 1);
}

TEST_CASE("PeerRenderer text", "[output]") {
    CHECK(PeerRenderer::to_text(sample_peers()) ==
          "AAA=\t10.0.0.1/32\tlaptop\n"
          "MMM=\t10.0.0.2/32, fd00::2/128\t\n"
          "ZZZ=\t10.0.0.3/32\t-\n");

    CHECK(PeerRenderer::to_text(PeerMap{}).empty());

    BlockError err;
    err.code = PeerErrorCode::ALLOWED_IPS_ENTRY_NOT_FOUND;
    err.block_index = 3;
    err.lines = {"PublicKey = A"};
    CHECK(PeerRenderer::to_text(std::vector<BlockError>{err}) ==
          "[Peer] #3: AllowedIPsEntryNotFound { lines: [\"PublicKey = A\"] }\n");
}
