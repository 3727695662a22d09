#include "test_framework.hpp"

#include "toolexec/common/fs.hpp"
#include "toolexec/common/json_util.hpp"
#include "toolexec/common/toml.hpp"

void register_common_tests(std::vector<toolexec::tests::TestCase> &tests) {
  using toolexec::tests::require;
  namespace common = toolexec::common;

  tests.push_back({"json_escape_control_characters", [] {
                     require(common::json_escape("a\"b\\c\n") == "a\\\"b\\\\c\\n", "basic escapes");
                     require(common::json_escape(std::string(1, '\x01')) == "\\u0001",
                             "control escape");
                     require(common::json_quote("h\xC3\xA9") == "\"h\xC3\xA9\"",
                             "utf-8 passes through");
                   }});

  tests.push_back({"json_validate_accepts_documents", [] {
                     require(common::json_validate("{}").ok(), "empty object");
                     require(common::json_validate(" [1, -2.5e10, true, null, \"x\"] ").ok(),
                             "mixed array");
                     require(common::json_validate("{\"a\":{\"b\":[{}]}}").ok(), "nested");
                     require(common::json_validate("42").ok(), "bare number");
                   }});

  tests.push_back({"json_validate_rejects_garbage", [] {
                     require(!common::json_validate("").ok(), "empty");
                     require(!common::json_validate("{").ok(), "unterminated");
                     require(!common::json_validate("{\"a\":1,}").ok(), "trailing comma");
                     require(!common::json_validate("{} {}").ok(), "two documents");
                     require(!common::json_validate("01").ok(), "leading zero");
                     require(!common::json_validate("'x'").ok(), "single quotes");
                   }});

  tests.push_back({"json_decode_string_handles_unicode_escapes", [] {
                     const auto plain = common::json_decode_string("\"a\\tb\"");
                     require(plain.ok() && plain.value() == "a\tb", "tab escape");
                     const auto e_acute = common::json_decode_string("\"\\u00e9\"");
                     require(e_acute.ok() && e_acute.value() == "\xC3\xA9", "two-byte utf-8");
                     const auto emoji = common::json_decode_string("\"\\ud83d\\ude00\"");
                     require(emoji.ok() && emoji.value() == "\xF0\x9F\x98\x80", "surrogate pair");
                     require(!common::json_decode_string("abc").ok(), "not a literal");
                   }});

  tests.push_back({"json_object_fields_keeps_raw_values", [] {
                     const auto fields =
                         common::json_object_fields(R"json({"code":"print(1)","input":{"a":[1,2]},"n":null})json");
                     require(fields.ok(), fields.error());
                     require(fields.value().at("input") == R"({"a":[1,2]})", "raw nested value");
                     require(common::json_field_string(fields.value(), "code") == "print(1)",
                             "decoded string");
                     require(!common::json_field_string(fields.value(), "input").has_value(),
                             "object is not a string");
                     require(fields.value().at("n") == "null", "null kept raw");
                     require(!common::json_object_fields("[1]").ok(), "array is not an object");
                   }});

  tests.push_back({"json_array_elements_splits_top_level", [] {
                     const auto elements =
                         common::json_array_elements(R"([{"id":"a","code":"x"}, [1,2], "s"])");
                     require(elements.ok(), elements.error());
                     require(elements.value().size() == 3, "three elements");
                     require(elements.value()[1] == "[1,2]", "raw nested array");
                     const auto empty = common::json_array_elements(" [ ] ");
                     require(empty.ok() && empty.value().empty(), "empty array");
                   }});

  tests.push_back({"toml_parses_sections_and_types", [] {
                     const auto doc = common::parse_toml(
                         "top = \"x\" # comment\n"
                         "[execution]\n"
                         "timeout_ms = 5_000\n"
                         "interpreter = \"python3 -I\"\n"
                         "banner = \"a#b\" # trailing\n"
                         "literal = 'C:\\path'\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_string("top") == "x", "top-level key");
                     require(doc.value().get_u64("execution.timeout_ms", 0) == 5000,
                             "digit separators");
                     require(doc.value().get_string("execution.interpreter") == "python3 -I",
                             "quoted string");
                     require(doc.value().get_string("execution.banner") == "a#b",
                             "quoted hash is not a comment");
                     require(doc.value().get_string("execution.literal") == "C:\\path",
                             "literal string kept verbatim");
                     require(!doc.value().has("execution.missing"), "absent key");
                     require(doc.value().get_u64("execution.interpreter", 7) == 7,
                             "non-number falls back");
                   }});

  tests.push_back({"toml_rejects_malformed_lines", [] {
                     require(!common::parse_toml("[]\n").ok(), "empty section");
                     require(!common::parse_toml("novalue\n").ok(), "missing equals");
                     require(!common::parse_toml("= 3\n").ok(), "missing key");
                   }});

  tests.push_back({"fs_helpers", [] {
                     require(common::trim("  a b \n") == "a b", "trim");
                     require(common::to_lower("AbC") == "abc", "lower");
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 of abc");
                     const auto a = common::random_hex(8);
                     const auto b = common::random_hex(8);
                     require(a.size() == 16 && a != b, "random suffixes differ");
                   }});
}
