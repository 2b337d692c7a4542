#include "talekeeper/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace talekeeper::common {

namespace {

void append_utf8(std::string &out, std::uint32_t cp) {
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

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  const auto *first = raw.data() + pos;
  auto [ptr, ec] = std::from_chars(first, first + 4, value, 16);
  if (ec != std::errc() || ptr != first + 4) {
    return std::nullopt;
  }
  return value;
}

bool is_literal_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '-' || ch == '+' ||
         ch == '.';
}

// End (exclusive) of the JSON value starting at pos, or npos when it is not a value.
std::size_t scan_value(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }

  std::size_t end = pos;
  while (end < json.size() && is_literal_char(json[end])) {
    ++end;
  }
  if (end == pos) {
    return std::string::npos;
  }
  const std::string literal = json.substr(pos, end - pos);
  if (literal == "true" || literal == "false" || literal == "null") {
    return end;
  }
  if (std::isdigit(static_cast<unsigned char>(literal.front())) != 0 || literal.front() == '-') {
    return end;
  }
  return std::string::npos;
}

std::optional<std::vector<std::string>> split_array_raw(const std::string &array_json) {
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return std::nullopt;
  }
  std::vector<std::string> out;
  pos = json_skip_ws(array_json, pos + 1);
  if (pos < array_json.size() && array_json[pos] == ']') {
    return out;
  }
  while (pos < array_json.size()) {
    const auto end = scan_value(array_json, pos);
    if (end == std::string::npos) {
      return std::nullopt;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = json_skip_ws(array_json, end);
    if (pos >= array_json.size()) {
      return std::nullopt;
    }
    if (array_json[pos] == ']') {
      return out;
    }
    if (array_json[pos] != ',') {
      return std::nullopt;
    }
    pos = json_skip_ws(array_json, pos + 1);
  }
  return std::nullopt;
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

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      auto cp = parse_hex4(raw, i + 1);
      if (!cp.has_value()) {
        out.push_back(esc);
        break;
      }
      i += 4;
      std::uint32_t code = *cp;
      if (code >= 0xD800 && code <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        if (auto low = parse_hex4(raw, i + 3); low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<JsonRawObject> json_parse_object_raw(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }

  JsonRawObject result;
  pos = json_skip_ws(json, pos + 1);
  if (pos < json.size() && json[pos] == '}') {
    if (json_skip_ws(json, pos + 1) != json.size()) {
      return std::nullopt;
    }
    return result;
  }

  while (pos < json.size()) {
    if (json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return std::nullopt;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);

    const auto value_end = scan_value(json, pos);
    if (value_end == std::string::npos) {
      return std::nullopt;
    }
    result[key] = json.substr(pos, value_end - pos);

    pos = json_skip_ws(json, value_end);
    if (pos >= json.size()) {
      return std::nullopt;
    }
    if (json[pos] == '}') {
      if (json_skip_ws(json, pos + 1) != json.size()) {
        return std::nullopt;
      }
      return result;
    }
    if (json[pos] != ',') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);
  }
  return std::nullopt;
}

std::optional<std::string> json_string_value(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return std::nullopt;
  }
  if (json_find_string_end(raw, 0) != raw.size() - 1) {
    return std::nullopt;
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::optional<std::int64_t> json_int_value(const std::string &raw) {
  if (raw.empty()) {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::optional<bool> json_bool_value(const std::string &raw) {
  if (raw == "true") {
    return true;
  }
  if (raw == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::vector<std::string>> json_parse_string_array(const std::string &array_json) {
  const auto elements = split_array_raw(array_json);
  if (!elements.has_value()) {
    return std::nullopt;
  }
  std::vector<std::string> out;
  out.reserve(elements->size());
  for (const auto &element : *elements) {
    auto value = json_string_value(element);
    if (!value.has_value()) {
      return std::nullopt;
    }
    out.push_back(std::move(*value));
  }
  return out;
}

std::optional<std::vector<std::int64_t>> json_parse_int_array(const std::string &array_json) {
  const auto elements = split_array_raw(array_json);
  if (!elements.has_value()) {
    return std::nullopt;
  }
  std::vector<std::int64_t> out;
  out.reserve(elements->size());
  for (const auto &element : *elements) {
    const auto value = json_int_value(element);
    if (!value.has_value()) {
      return std::nullopt;
    }
    out.push_back(*value);
  }
  return out;
}

std::optional<std::vector<std::string>>
json_split_top_level_objects(const std::string &array_json) {
  auto elements = split_array_raw(array_json);
  if (!elements.has_value()) {
    return std::nullopt;
  }
  for (const auto &element : *elements) {
    if (element.empty() || element.front() != '{') {
      return std::nullopt;
    }
  }
  return elements;
}

} // namespace talekeeper::common
