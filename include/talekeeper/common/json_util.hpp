#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace talekeeper::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (handles the short escapes and \uXXXX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of an object, values kept as raw JSON text (strings keep their quotes).
using JsonRawObject = std::map<std::string, std::string>;

/// Parse the top level of a JSON object. Returns nullopt when the text is not a well-formed
/// object at the top level.
[[nodiscard]] std::optional<JsonRawObject> json_parse_object_raw(const std::string &json);

/// Decode a raw JSON string token ("...") into its value; nullopt if raw is not a string.
[[nodiscard]] std::optional<std::string> json_string_value(const std::string &raw);

/// Decode a raw JSON integer token.
[[nodiscard]] std::optional<std::int64_t> json_int_value(const std::string &raw);

/// Decode a raw JSON true/false token.
[[nodiscard]] std::optional<bool> json_bool_value(const std::string &raw);

/// Extract a string array from a raw JSON array like ["a","b"].
[[nodiscard]] std::optional<std::vector<std::string>>
json_parse_string_array(const std::string &array_json);

/// Extract an integer array from a raw JSON array like [1,-2,3].
[[nodiscard]] std::optional<std::vector<std::int64_t>>
json_parse_int_array(const std::string &array_json);

/// Split a JSON array of objects into individual object strings. nullopt when the array is
/// malformed or holds anything other than objects.
[[nodiscard]] std::optional<std::vector<std::string>>
json_split_top_level_objects(const std::string &array_json);

} // namespace talekeeper::common
