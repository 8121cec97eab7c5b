#include "parser/comment_parser.hpp"
#include "core/utils.hpp"

namespace wgpeers {

static constexpr char kPound = '#';
static constexpr char kEquals = '=';

std::optional<CommentParser::KeyValue> CommentParser::key_value(std::string_view line) {
    if (line.empty() || line.front() != kPound) {
        return std::nullopt;
    }
    line.remove_prefix(1);

    const auto equals_pos = line.find(kEquals);
    if (equals_pos == std::string_view::npos) {
        return std::nullopt;
    }

    // Empty value is still a value
    return KeyValue{
        utils::trim(line.substr(0, equals_pos)),
        utils::trim(line.substr(equals_pos + 1))
    };
}

} // namespace wgpeers
