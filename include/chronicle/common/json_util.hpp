#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace chronicle::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string (simple escapes and \uXXXX, emitted as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when `json` is exactly one syntactically valid JSON object (surrounding
/// whitespace allowed). Truncated or trailing-garbage lines are rejected.
[[nodiscard]] bool json_is_valid_object(const std::string &json);

/// Parse a flat JSON object into a key→value map (top-level only). String values are
/// unescaped; objects, arrays, numbers and literals keep their raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Encode a string map as a JSON object with sorted keys.
[[nodiscard]] std::string json_encode_flat(const JsonFlatMap &values);

/// Member of a flat object: decoded string text, or the raw JSON of any other
/// value (number, literal, array, object).
struct JsonValue {
  std::string text;
  bool is_raw = false;

  JsonValue() = default;
  JsonValue(std::string value) : text(std::move(value)) {}
  JsonValue(const char *value) : text(value) {}

  [[nodiscard]] static JsonValue raw(std::string json) {
    JsonValue value(std::move(json));
    value.is_raw = true;
    return value;
  }

  /// Compares the text only, whatever the JSON type.
  bool operator==(const std::string &other) const { return text == other; }
  bool operator==(const char *other) const { return text == other; }
  bool operator==(const JsonValue &) const = default;
};

using JsonObject = std::unordered_map<std::string, JsonValue>;

/// Like json_parse_flat, remembering which values were not JSON strings.
[[nodiscard]] JsonObject json_parse_object(const std::string &json);

/// Sorted keys; raw values are emitted unquoted.
[[nodiscard]] std::string json_encode_object(const JsonObject &values);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Shortest representation that parses back to the same double.
[[nodiscard]] std::string json_format_double(double value);

[[nodiscard]] std::optional<std::uint64_t> json_parse_u64(const std::string &raw);
[[nodiscard]] std::optional<double> json_parse_double(const std::string &raw);

} // namespace chronicle::common
