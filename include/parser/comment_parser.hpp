#pragma once

#include <optional>
#include <string_view>

namespace wgpeers {

/**
 * @brief Metadata key carried in "# friendly_name = ..." comments
 */
inline constexpr std::string_view kFriendlyNameKey = "friendly_name";

/**
 * @brief Comment sub-parser - "# key = value" metadata lines
 *
 * WireGuard ignores '#' lines, which makes them a place to store metadata
 * such as a human-friendly peer name. This parser only splits the line;
 * deciding which keys mean something is left to the caller.
 *
 * Example:
 *   "#  test  =  This can be tricky  "  ->  {"test", "This can be tricky"}
 *   "#  nasty  ="                       ->  {"nasty", ""}
 *   "# ignore"                          ->  nullopt
 */
class CommentParser {
public:
    /**
     * @brief Trimmed key/value views into the parsed line
     */
    struct KeyValue {
        std::string_view key;
        std::string_view value;

        bool operator==(const KeyValue&) const = default;
    };

    /**
     * @brief Split a comment line at its first '='
     * @param line Line starting with '#' (exactly one '#' is dropped)
     * @return Key and value, both trimmed; nullopt when there is no '=' or
     *         the line does not start with '#'
     */
    [[nodiscard]] static std::optional<KeyValue> key_value(std::string_view line);
};

} // namespace wgpeers
