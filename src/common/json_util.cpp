#include "feedrank/common/json_util.hpp"

#include <array>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdint>

namespace feedrank::common {

namespace {

void append_utf8(std::string &out, std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  std::uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(raw.data() + pos, raw.data() + pos + 4, value, 16);
  if (ec != std::errc() || ptr != raw.data() + pos + 4) {
    return false;
  }
  out = value;
  return true;
}

// Locates the first character of the value belonging to `field`, or npos.
std::size_t json_value_start(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return std::string::npos;
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return std::string::npos;
  }
  const std::size_t pos = json_skip_ws(json, colon + 1);
  return pos < json.size() ? pos : std::string::npos;
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
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr std::array<char, 16> hex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                     '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
        escaped += "\\u00";
        escaped.push_back(hex[(static_cast<unsigned char>(ch) >> 4) & 0x0F]);
        escaped.push_back(hex[static_cast<unsigned char>(ch) & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
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
      std::uint32_t code_point = 0;
      if (!parse_hex4(raw, i + 1, code_point)) {
        out.push_back(next);
        break;
      }
      i += 4;
      if (code_point >= 0xD800 && code_point <= 0xDBFF && i + 6 < raw.size() &&
          raw.compare(i + 1, 2, "\\u") == 0) {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted, from);
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
    escaped = !escaped && ch == '\\';
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = json_value_start(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  auto pos = json_value_start(json, field);
  if (pos == std::string::npos || json[pos] == '"') {
    return "";
  }
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  return json.substr(start, pos - start);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto pos = json_value_start(json, field);
  if (pos == std::string::npos || json[pos] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto pos = json_value_start(json, field);
  if (pos == std::string::npos || json[pos] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  const std::size_t open = json_skip_ws(array_json, 0);
  if (open >= array_json.size() || array_json[open] != '[') {
    return out;
  }

  std::size_t pos = open + 1;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto end = json_find_string_end(array_json, pos);
    if (end == std::string::npos) {
      break;
    }
    out.push_back(json_unescape(array_json.substr(pos + 1, end - pos - 1)));
    pos = end + 1;
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += "\"" + json_escape(values[i]) + "\"";
  }
  out += "]";
  return out;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(array_json, i);
      if (end == std::string::npos) {
        break;
      }
      i = end;
      continue;
    }
    if (ch != '{') {
      continue;
    }
    const auto end = json_find_matching_token(array_json, i, '{', '}');
    if (end == std::string::npos) {
      break;
    }
    out.push_back(array_json.substr(i, end - i + 1));
    i = end;
  }
  return out;
}

std::string json_number(const double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  std::array<char, 64> buffer{};
  const auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
  if (ec != std::errc()) {
    return "null";
  }
  return std::string(buffer.data(), ptr);
}

} // namespace feedrank::common
