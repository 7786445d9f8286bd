#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace feedrank::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document. Missing or null yields "".
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as string) from a JSON document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a bare JSON array of strings like ["a","b"].
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Encode strings as a compact JSON array.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Shortest round-trippable decimal form of a double, "null" for non-finite values.
[[nodiscard]] std::string json_number(double value);

} // namespace feedrank::common
