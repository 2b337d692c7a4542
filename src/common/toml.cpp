#include "talekeeper/common/toml.hpp"

#include "talekeeper/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace talekeeper::common {

namespace {

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  bool escaped = false;
  std::string output;
  output.reserve(line.size());

  for (const char ch : line) {
    if (in_quotes && !escaped && ch == '\\') {
      escaped = true;
      output.push_back(ch);
      continue;
    }
    if (ch == '"' && !escaped) {
      in_quotes = !in_quotes;
    }
    escaped = false;
    if (!in_quotes && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size() - 2);
  bool escaped = false;
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (!escaped) {
      if (ch == '\\') {
        escaped = true;
      } else {
        out.push_back(ch);
      }
      continue;
    }
    switch (ch) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

bool is_valid_key(const std::string &key) {
  if (key.empty()) {
    return false;
  }
  for (const char ch : key) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '_' || ch == '-' || ch == '.';
    if (!ok) {
      return false;
    }
  }
  return true;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::optional<std::string> TomlDocument::find_string(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return unquote(it->second);
}

std::optional<std::uint64_t> TomlDocument::find_u64(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  std::string normalized = trim(it->second);
  std::string digits;
  digits.reserve(normalized.size());
  for (const char ch : normalized) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (digits.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  return find_string(key).value_or(fallback);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  return find_u64(key).value_or(fallback);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (!is_valid_key(section)) {
        return Result<TomlDocument>::failure(ErrorCode::ConfigError,
                                             "Invalid section name at line " +
                                                 std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorCode::ConfigError,
                                           "Invalid key/value at line " +
                                               std::to_string(line_number));
    }

    const std::string key = trim(clean.substr(0, equals));
    const std::string value = trim(clean.substr(equals + 1));
    if (!is_valid_key(key)) {
      return Result<TomlDocument>::failure(ErrorCode::ConfigError,
                                           "Invalid key at line " + std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure(ErrorCode::ConfigError,
                                           "Missing value at line " +
                                               std::to_string(line_number));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (!document.values.emplace(full_key, value).second) {
      return Result<TomlDocument>::failure(ErrorCode::ConfigError,
                                           "Duplicate key '" + full_key + "' at line " +
                                               std::to_string(line_number));
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    if (ch == '\n') {
      escaped += "\\n";
      continue;
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace talekeeper::common
