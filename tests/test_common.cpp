#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "chronicle/common/fs.hpp"
#include "chronicle/common/id.hpp"
#include "chronicle/common/json_util.hpp"
#include "chronicle/common/time.hpp"
#include "chronicle/common/toml.hpp"

#include <set>
#include <string>

void register_common_tests(std::vector<chronicle::tests::TestCase> &tests) {
  using chronicle::tests::require;
  namespace c = chronicle::common;
  namespace t = chronicle::testing;

  tests.push_back({"json_escape_round_trips_control_and_unicode", [] {
                     const std::string original = "line1\nline2\t\"quoted\" \\ caf\xC3\xA9";
                     const std::string escaped = c::json_escape(original);
                     require(escaped.find('\n') == std::string::npos, "newline must be escaped");
                     require(c::json_unescape(escaped) == original, "round trip mismatch");
                     require(c::json_unescape("\\u00e9") == "\xC3\xA9", "\\u escape to UTF-8");
                   }});

  tests.push_back({"json_is_valid_object_rejects_truncated_lines", [] {
                     require(c::json_is_valid_object(R"({"a":1,"b":[1,2],"c":{"d":null}})"),
                             "valid object rejected");
                     require(c::json_is_valid_object("  {}  "), "whitespace around object");
                     require(!c::json_is_valid_object(R"({"a":1,"b":)"), "truncated accepted");
                     require(!c::json_is_valid_object(R"({"a":1} trailing)"),
                             "trailing garbage accepted");
                     require(!c::json_is_valid_object("[1,2]"), "array is not an object");
                     require(!c::json_is_valid_object(""), "empty accepted");
                   }});

  tests.push_back({"json_parse_flat_keeps_nested_values_raw", [] {
                     const auto map = c::json_parse_flat(
                         R"({"name":"a\"b","count":42,"nested":{"x":1},"list":[1,2],"none":null})");
                     require(map.at("name") == "a\"b", "string should be unescaped");
                     require(map.at("count") == "42", "number keeps raw text");
                     require(map.at("nested") == R"({"x":1})", "object keeps raw text");
                     require(map.at("list") == "[1,2]", "array keeps raw text");
                     require(map.at("none") == "null", "null keeps raw text");
                   }});

  tests.push_back({"json_encode_flat_sorts_keys", [] {
                     const c::JsonFlatMap map = {{"b", "2"}, {"a", "1"}};
                     require(c::json_encode_flat(map) == R"({"a":"1","b":"2"})",
                             "unexpected encoding");
                     require(c::json_encode_flat({}) == "{}", "empty map");
                   }});

  tests.push_back({"json_object_keeps_value_types", [] {
                     const auto object =
                         c::json_parse_object(R"({"s":"1","n":1,"flags":[true,false],"o":{"k":null}})");
                     require(!object.at("s").is_raw && object.at("s") == "1", "string value");
                     require(object.at("n").is_raw && object.at("n") == "1", "number value");
                     require(object.at("flags").is_raw, "array value");
                     require(c::json_encode_object(object) ==
                                 R"({"flags":[true,false],"n":1,"o":{"k":null},"s":"1"})",
                             "types survive re-encoding");

                     c::JsonObject built;
                     built["temperature"] = c::JsonValue::raw("0.2");
                     built["model"] = "gpt-4";
                     require(c::json_encode_object(built) == R"({"model":"gpt-4","temperature":0.2})",
                             "raw values are unquoted");
                   }});

  tests.push_back({"json_format_double_stays_a_float", [] {
                     require(c::json_format_double(0.04) == "0.04", "shortest form");
                     require(c::json_format_double(2.0) == "2.0", "integral value keeps .0");
                     require(c::json_parse_double("0.04").value_or(0) == 0.04, "parse back");
                     require(c::json_parse_u64("17").value_or(0) == 17, "parse u64");
                     require(!c::json_parse_u64("-3").has_value(), "negative is not u64");
                   }});

  tests.push_back({"json_parse_u64_rejects_out_of_range_numbers", [] {
                     require(!c::json_parse_u64("1e30").has_value(), "1e30 does not fit");
                     require(!c::json_parse_u64("18446744073709551616").has_value(),
                             "2^64 does not fit");
                     require(c::json_parse_u64("18446744073709551615").value_or(0) ==
                                 18446744073709551615ULL,
                             "max u64 parses");
                     require(c::json_parse_u64("1.5e3").value_or(0) == 1500, "exponent form");
                   }});

  tests.push_back({"iso8601_round_trip_and_offsets", [] {
                     const auto ts = t::at("2024-01-15T10:30:00.123456Z");
                     require(c::format_iso8601(ts) == "2024-01-15T10:30:00.123456Z",
                             "format mismatch");
                     require(t::at("2024-01-15T12:30:00+02:00") == t::at("2024-01-15T10:30:00Z"),
                             "offset not applied");
                     require(t::at("2024-01-15") == t::at("2024-01-15T00:00:00Z"),
                             "date-only is midnight UTC");
                     require(!c::parse_iso8601("2024-13-01T00:00:00Z").has_value(),
                             "month 13 accepted");
                     require(!c::parse_iso8601("yesterday").has_value(), "garbage accepted");
                   }});

  tests.push_back({"month_partition_uses_utc_month", [] {
                     require(c::month_partition(t::at("2024-01-31T23:59:59Z")) == "202401",
                             "january partition");
                     require(c::month_partition(t::at("2024-02-01T00:30:00+01:00")) == "202401",
                             "offset shifts back into january");
                     require(c::month_partition(t::at("1999-12-01T00:00:00Z")) == "199912",
                             "december partition");
                   }});

  tests.push_back({"generate_id_is_uuid_shaped_and_unique", [] {
                     std::set<std::string> ids;
                     for (int i = 0; i < 200; ++i) {
                       const auto id = c::generate_id();
                       require(id.size() == 36, "uuid length");
                       require(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-',
                               "uuid dashes");
                       require(id[14] == '4', "version nibble");
                       ids.insert(id);
                     }
                     require(ids.size() == 200, "ids should be unique");
                     require(c::random_hex(8).size() == 16, "random_hex length");
                   }});

  tests.push_back({"toml_quoted_keys_and_section_keys", [] {
                     const auto doc = c::parse_toml(R"(
[pricing]
currency = "USD" # trailing comment
"openai:gpt-4" = [0.03, 0.06, "USD"]
"anthropic:claude-3" = [0.015, 0.075]
)");
                     require(doc.ok(), doc.error());
                     const auto keys = doc.value().section_keys("pricing");
                     require(keys.size() == 3, "expected three pricing keys");
                     require(keys[0] == "anthropic:claude-3", "keys should be sorted");
                     const auto gpt = doc.value().get_string_array("pricing.openai:gpt-4");
                     require(gpt.size() == 3 && gpt[2] == "USD", "array parsed");
                     require(doc.value().get_string("pricing.currency") == "USD",
                             "comment stripped");
                   }});

  tests.push_back({"toml_rejects_lines_without_assignment", [] {
                     const auto doc = c::parse_toml("[history]\nbase_dir\n");
                     require(!doc.ok(), "missing '=' should fail");
                   }});

  tests.push_back({"write_file_atomic_replaces_content", [] {
                     t::TempWorkspace ws;
                     const auto path = ws.path() / "nested" / "file.txt";
                     require(c::ensure_dir(path.parent_path()).ok(), "mkdir");
                     require(c::write_file_atomic(path, "first\n").ok(), "first write");
                     require(c::write_file_atomic(path, "second\n").ok(), "second write");
                     const auto content = c::read_file(path);
                     require(content.ok() && content.value() == "second\n", "content replaced");
                     require(!c::read_file(ws.path() / "missing").ok(), "missing file fails");
                   }});
}
