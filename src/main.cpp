#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "io/text_file.hpp"
#include "output/peer_renderer.hpp"
#include "parser/peer_config_parser.hpp"

#include <cstdlib>
#include <exception>
#include <format>
#include <iostream>

using namespace wgpeers;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfigOrIo = 1;
constexpr int kExitParseFailure = 2;

void print_json(const nlohmann::json& doc, bool pretty) {
    std::cout << (pretty ? doc.dump(2) : doc.dump()) << '\n';
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        std::string config_file = "config/wg_peers.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        utils::log::info(std::format("[1/3] Loading configuration from {}", config_file));

        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return kExitConfigOrIo;
        }
        const auto& cfg = config_result.config;
        utils::log::set_level(cfg.logging.level);

        utils::log::info(std::format("[2/3] Reading WireGuard config {}", cfg.input.path));

        auto text = io::read_text_file(cfg.input.path);
        if (text.is_error()) {
            utils::log::error(std::format("{}: {}",
                error_category_name(text.error_category()), text.error_message()));
            return kExitConfigOrIo;
        }

        utils::log::info(std::format("[3/3] Parsing peers ({})", parse_mode_name(cfg.parser.mode)));

        const auto result = PeerConfigParser::parse(text.value(), cfg.parser.mode);
        if (!result.success) {
            for (const auto& err : result.errors) {
                utils::log::error(std::format("[Peer] block {}: {}", err.block_index, err.describe()));
            }
            if (cfg.output.format == OutputFormat::JSON) {
                print_json(PeerRenderer::to_json(result.errors), cfg.output.pretty);
            } else {
                std::cout << PeerRenderer::to_text(result.errors);
            }
            return kExitParseFailure;
        }

        if (cfg.output.format == OutputFormat::JSON) {
            print_json(PeerRenderer::to_json(result.peers), cfg.output.pretty);
        } else {
            std::cout << PeerRenderer::to_text(result.peers);
        }

        utils::log::info(std::format("Parsed {} peer(s)", result.peers.size()));
        return kExitOk;

    } catch (const std::exception& e) {
        utils::log::error(std::format("Fatal error: {}", e.what()));
        return EXIT_FAILURE;
    }
}
