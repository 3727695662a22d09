#pragma once

#include "toolexec/common/result.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolexec::common {

/// Escape a string for embedding inside a JSON string literal. Control characters are
/// emitted as \u00XX; bytes >= 0x80 pass through untouched.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Strict syntax check of a complete JSON document (any value type at top level).
[[nodiscard]] Status json_validate(const std::string &text);

/// Decode a JSON string literal (including the surrounding quotes) into UTF-8 text.
[[nodiscard]] Result<std::string> json_decode_string(const std::string &literal);

/// Top-level fields of a JSON object: key -> raw JSON text of the value.
using JsonFields = std::unordered_map<std::string, std::string>;

/// Split a JSON object into its top-level fields. Fails unless `json` is a valid object.
[[nodiscard]] Result<JsonFields> json_object_fields(const std::string &json);

/// Split a JSON array into the raw text of its elements. Fails unless `json` is a valid array.
[[nodiscard]] Result<std::vector<std::string>> json_array_elements(const std::string &json);

/// Decoded string value of a field, or nullopt when absent or not a string.
[[nodiscard]] std::optional<std::string> json_field_string(const JsonFields &fields,
                                                           const std::string &key);

/// Boolean value of a field, or nullopt when absent or not a boolean.
[[nodiscard]] std::optional<bool> json_field_bool(const JsonFields &fields, const std::string &key);

} // namespace toolexec::common
