#include "notegraph/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace notegraph::common {

namespace {

void append_utf8(std::string &out, const unsigned code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::string unescape(const std::string &raw) {
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
      unsigned code_point = 0;
      if (i + 4 < raw.size()) {
        const auto *first = raw.data() + i + 1;
        auto [ptr, ec] = std::from_chars(first, first + 4, code_point, 16);
        if (ec == std::errc() && ptr == first + 4) {
          append_utf8(out, code_point);
          i += 4;
          break;
        }
      }
      out.push_back(next);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t find_string_end(const std::string &json, const std::size_t quote_pos) {
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

std::size_t find_matching_token(const std::string &json, const std::size_t open_pos,
                                const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = find_string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t field_value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  // The same text can appear as a string value; only a key is followed by ':'.
  for (auto key_pos = json.find(quoted); key_pos != std::string::npos;
       key_pos = json.find(quoted, key_pos + 1)) {
    const auto colon = skip_ws(json, key_pos + quoted.size());
    if (colon < json.size() && json[colon] == ':') {
      return skip_ws(json, colon + 1);
    }
  }
  return std::string::npos;
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
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto pos = field_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto pos = field_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] != '[') {
    return "";
  }
  const auto end = find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

Result<std::vector<std::string>> json_parse_string_array(const std::string &array) {
  const std::size_t open = skip_ws(array, 0);
  if (open >= array.size() || array[open] != '[') {
    return Result<std::vector<std::string>>::failure("expected JSON array",
                                                     ErrorCode::InvalidArgument);
  }
  const auto close = find_matching_token(array, open, '[', ']');
  if (close == std::string::npos) {
    return Result<std::vector<std::string>>::failure("unterminated JSON array",
                                                     ErrorCode::InvalidArgument);
  }

  std::vector<std::string> out;
  std::size_t pos = open + 1;
  while (pos < close) {
    pos = skip_ws(array, pos);
    if (pos >= close) {
      break;
    }
    if (array[pos] == '"') {
      const auto end = find_string_end(array, pos);
      if (end == std::string::npos || end > close) {
        return Result<std::vector<std::string>>::failure("unterminated JSON string",
                                                         ErrorCode::InvalidArgument);
      }
      out.push_back(unescape(array.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return Result<std::vector<std::string>>::success(std::move(out));
}

Result<std::vector<double>> json_parse_number_array(const std::string &array) {
  const std::size_t open = skip_ws(array, 0);
  if (open >= array.size() || array[open] != '[') {
    return Result<std::vector<double>>::failure("expected JSON array", ErrorCode::InvalidArgument);
  }
  const auto close = find_matching_token(array, open, '[', ']');
  if (close == std::string::npos) {
    return Result<std::vector<double>>::failure("unterminated JSON array",
                                                ErrorCode::InvalidArgument);
  }

  std::vector<double> out;
  std::stringstream stream(array.substr(open + 1, close - open - 1));
  std::string item;
  while (std::getline(stream, item, ',')) {
    const std::size_t begin = skip_ws(item, 0);
    if (begin >= item.size()) {
      continue;
    }
    try {
      out.push_back(std::stod(item.substr(begin)));
    } catch (const std::exception &) {
      return Result<std::vector<double>>::failure("invalid number in JSON array: " + item,
                                                  ErrorCode::InvalidArgument);
    }
  }
  return Result<std::vector<double>>::success(std::move(out));
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += "\"" + json_escape(values[i]) + "\"";
  }
  out += "]";
  return out;
}

std::string json_number(const double value) {
  if (!std::isfinite(value)) {
    return "null";
  }
  char buffer[32];
  auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return "0";
  }
  return std::string(buffer, ptr);
}

} // namespace notegraph::common
