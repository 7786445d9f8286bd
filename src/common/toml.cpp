#include "feedrank/common/toml.hpp"

#include "feedrank/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace feedrank::common {

namespace {

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote == '\0' && (ch == '"' || ch == '\'')) {
      quote = ch;
    } else if (quote != '\0' && ch == quote && (quote == '\'' || line[i - 1] != '\\')) {
      quote = '\0';
    }
    if (quote == '\0' && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

// Basic strings honour backslash escapes; literal strings are taken verbatim.
std::string unquote(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
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
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(ch);
      break;
    }
    escaped = false;
  }
  return out;
}

std::string strip_digit_separators(std::string value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (ch != '_') {
      out.push_back(ch);
    }
  }
  return out;
}

int bracket_balance(const std::string &text) {
  int balance = 0;
  char quote = '\0';
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (quote == '\0' && (ch == '"' || ch == '\'')) {
      quote = ch;
      continue;
    }
    if (quote != '\0') {
      if (ch == quote && (quote == '\'' || text[i - 1] != '\\')) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '[') {
      ++balance;
    } else if (ch == ']') {
      --balance;
    }
  }
  return balance;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
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
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string normalized = strip_digit_separators(trim(it->second));
  std::uint64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string normalized = strip_digit_separators(trim(it->second));
  if (!normalized.empty() && normalized.front() == '+') {
    normalized.erase(0, 1);
  }
  double parsed = 0.0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = trim(clean_line.substr(0, equals_index));
    std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number));
    }

    // Arrays may continue over several lines until the brackets balance.
    const std::size_t start_line = line_number;
    while (!value.empty() && value.front() == '[' && bracket_balance(value) > 0) {
      if (!std::getline(stream, line)) {
        return Result<TomlDocument>::failure("Unterminated array starting at line " +
                                             std::to_string(start_line));
      }
      ++line_number;
      value += " " + trim(strip_comment(line));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 2);
  escaped.push_back('"');
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      escaped.push_back('\\');
      escaped.push_back(ch);
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      escaped.push_back(ch);
      break;
    }
  }
  escaped.push_back('"');
  return escaped;
}

} // namespace feedrank::common
