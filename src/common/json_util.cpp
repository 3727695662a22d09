#include "toolexec/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace toolexec::common {

namespace {

constexpr std::size_t kNpos = std::string::npos;
constexpr std::size_t kMaxDepth = 512;

bool is_digit(const char ch) { return ch >= '0' && ch <= '9'; }

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool read_hex4(const std::string &text, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(text[i]);
    if (digit < 0) {
      return false;
    }
    out = (out << 4) | static_cast<std::uint32_t>(digit);
  }
  return true;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

// Each scan_* function takes the position of the first character of the token and returns
// the position one past its end, or npos when the text is not valid JSON.
std::size_t scan_value(const std::string &text, std::size_t pos, std::size_t depth);

std::size_t scan_string(const std::string &text, std::size_t pos) {
  if (pos >= text.size() || text[pos] != '"') {
    return kNpos;
  }
  ++pos;
  while (pos < text.size()) {
    const char ch = text[pos];
    if (ch == '"') {
      return pos + 1;
    }
    if (static_cast<unsigned char>(ch) < 0x20) {
      return kNpos;
    }
    if (ch != '\\') {
      ++pos;
      continue;
    }
    if (pos + 1 >= text.size()) {
      return kNpos;
    }
    const char escaped = text[pos + 1];
    switch (escaped) {
    case '"':
    case '\\':
    case '/':
    case 'b':
    case 'f':
    case 'n':
    case 'r':
    case 't':
      pos += 2;
      break;
    case 'u': {
      std::uint32_t unused = 0;
      if (!read_hex4(text, pos + 2, unused)) {
        return kNpos;
      }
      pos += 6;
      break;
    }
    default:
      return kNpos;
    }
  }
  return kNpos;
}

std::size_t scan_number(const std::string &text, std::size_t pos) {
  if (pos < text.size() && text[pos] == '-') {
    ++pos;
  }
  if (pos >= text.size()) {
    return kNpos;
  }
  if (text[pos] == '0') {
    ++pos;
  } else if (is_digit(text[pos])) {
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
  } else {
    return kNpos;
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    if (pos >= text.size() || !is_digit(text[pos])) {
      return kNpos;
    }
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      ++pos;
    }
    if (pos >= text.size() || !is_digit(text[pos])) {
      return kNpos;
    }
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
  }
  return pos;
}

std::size_t scan_literal(const std::string &text, const std::size_t pos, const char *literal) {
  const std::string word(literal);
  if (text.compare(pos, word.size(), word) != 0) {
    return kNpos;
  }
  return pos + word.size();
}

std::size_t scan_array(const std::string &text, std::size_t pos, const std::size_t depth) {
  pos = json_skip_ws(text, pos + 1);
  if (pos < text.size() && text[pos] == ']') {
    return pos + 1;
  }
  while (pos < text.size()) {
    pos = scan_value(text, pos, depth + 1);
    if (pos == kNpos) {
      return kNpos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return kNpos;
    }
    if (text[pos] == ']') {
      return pos + 1;
    }
    if (text[pos] != ',') {
      return kNpos;
    }
    pos = json_skip_ws(text, pos + 1);
  }
  return kNpos;
}

std::size_t scan_object(const std::string &text, std::size_t pos, const std::size_t depth) {
  pos = json_skip_ws(text, pos + 1);
  if (pos < text.size() && text[pos] == '}') {
    return pos + 1;
  }
  while (pos < text.size()) {
    pos = scan_string(text, pos);
    if (pos == kNpos) {
      return kNpos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] != ':') {
      return kNpos;
    }
    pos = scan_value(text, json_skip_ws(text, pos + 1), depth + 1);
    if (pos == kNpos) {
      return kNpos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return kNpos;
    }
    if (text[pos] == '}') {
      return pos + 1;
    }
    if (text[pos] != ',') {
      return kNpos;
    }
    pos = json_skip_ws(text, pos + 1);
  }
  return kNpos;
}

std::size_t scan_value(const std::string &text, const std::size_t pos, const std::size_t depth) {
  if (pos >= text.size() || depth > kMaxDepth) {
    return kNpos;
  }
  switch (text[pos]) {
  case '{':
    return scan_object(text, pos, depth);
  case '[':
    return scan_array(text, pos, depth);
  case '"':
    return scan_string(text, pos);
  case 't':
    return scan_literal(text, pos, "true");
  case 'f':
    return scan_literal(text, pos, "false");
  case 'n':
    return scan_literal(text, pos, "null");
  default:
    return scan_number(text, pos);
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\n' || text[pos] == '\r' ||
                               text[pos] == '\t')) {
    ++pos;
  }
  return pos;
}

Status json_validate(const std::string &text) {
  const std::size_t start = json_skip_ws(text, 0);
  if (start >= text.size()) {
    return Status::error("empty JSON document");
  }
  const std::size_t end = scan_value(text, start, 0);
  if (end == kNpos) {
    return Status::error("malformed JSON value");
  }
  if (json_skip_ws(text, end) != text.size()) {
    return Status::error("unexpected trailing characters after JSON value");
  }
  return Status::success();
}

Result<std::string> json_decode_string(const std::string &literal) {
  const std::size_t start = json_skip_ws(literal, 0);
  const std::size_t end = scan_string(literal, start);
  if (end == kNpos || json_skip_ws(literal, end) != literal.size()) {
    return Result<std::string>::failure("not a JSON string literal");
  }

  std::string out;
  out.reserve(end - start);
  for (std::size_t i = start + 1; i + 1 < end; ++i) {
    const char ch = literal[i];
    if (ch != '\\') {
      out.push_back(ch);
      continue;
    }
    const char escaped = literal[++i];
    switch (escaped) {
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'u': {
      std::uint32_t cp = 0;
      (void)read_hex4(literal, i + 1, cp);
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        std::uint32_t low = 0;
        if (i + 6 < end && literal[i + 1] == '\\' && literal[i + 2] == 'u' &&
            read_hex4(literal, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        } else {
          cp = 0xFFFD;
        }
      } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
        cp = 0xFFFD;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(escaped);
      break;
    }
  }
  return Result<std::string>::success(std::move(out));
}

Result<JsonFields> json_object_fields(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonFields>::failure("expected JSON object");
  }

  JsonFields fields;
  pos = json_skip_ws(json, pos + 1);
  bool closed = false;
  if (pos < json.size() && json[pos] == '}') {
    ++pos;
    closed = true;
  }
  while (!closed && pos < json.size()) {
    const std::size_t key_end = scan_string(json, pos);
    if (key_end == kNpos) {
      return Result<JsonFields>::failure("malformed object key");
    }
    auto key = json_decode_string(json.substr(pos, key_end - pos));
    if (!key.ok()) {
      return Result<JsonFields>::failure(key.error());
    }

    pos = json_skip_ws(json, key_end);
    if (pos >= json.size() || json[pos] != ':') {
      return Result<JsonFields>::failure("expected ':' after object key");
    }
    const std::size_t value_start = json_skip_ws(json, pos + 1);
    const std::size_t value_end = scan_value(json, value_start, 1);
    if (value_end == kNpos) {
      return Result<JsonFields>::failure("malformed value for key '" + key.value() + "'");
    }
    fields[key.value()] = json.substr(value_start, value_end - value_start);

    pos = json_skip_ws(json, value_end);
    if (pos >= json.size()) {
      break;
    }
    if (json[pos] == '}') {
      ++pos;
      closed = true;
      break;
    }
    if (json[pos] != ',') {
      return Result<JsonFields>::failure("expected ',' or '}' in object");
    }
    pos = json_skip_ws(json, pos + 1);
  }

  if (!closed) {
    return Result<JsonFields>::failure("unterminated JSON object");
  }
  if (json_skip_ws(json, pos) != json.size()) {
    return Result<JsonFields>::failure("unexpected trailing characters after JSON object");
  }
  return Result<JsonFields>::success(std::move(fields));
}

Result<std::vector<std::string>> json_array_elements(const std::string &json) {
  using ElementsResult = Result<std::vector<std::string>>;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '[') {
    return ElementsResult::failure("expected JSON array");
  }
  const std::size_t end = scan_array(json, pos, 0);
  if (end == kNpos || json_skip_ws(json, end) != json.size()) {
    return ElementsResult::failure("malformed JSON array");
  }

  // The array is known to be valid, so only element boundaries need to be found.
  std::vector<std::string> elements;
  pos = json_skip_ws(json, pos + 1);
  while (pos < end && json[pos] != ']') {
    const std::size_t element_end = scan_value(json, pos, 1);
    elements.push_back(json.substr(pos, element_end - pos));
    pos = json_skip_ws(json, element_end);
    if (json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
    }
  }
  return ElementsResult::success(std::move(elements));
}

std::optional<std::string> json_field_string(const JsonFields &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || it->second.empty() || it->second.front() != '"') {
    return std::nullopt;
  }
  auto decoded = json_decode_string(it->second);
  if (!decoded.ok()) {
    return std::nullopt;
  }
  return decoded.value();
}

std::optional<bool> json_field_bool(const JsonFields &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  if (it->second == "true") {
    return true;
  }
  if (it->second == "false") {
    return false;
  }
  return std::nullopt;
}

} // namespace toolexec::common
