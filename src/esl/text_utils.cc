#include "fsesl/esl/text_utils.h"

#include <algorithm>

namespace fsesl {
namespace esl {

namespace {

constexpr char kWhitespace[] = " \t\r\n\v\f";

int hexValue(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

std::vector<std::string> splitLines(const std::string& str) {
  std::vector<std::string> lines;
  size_t pos = 0;
  for (;;) {
    size_t eol = str.find('\n', pos);
    if (eol == std::string::npos) {
      lines.push_back(str.substr(pos));
      break;
    }
    lines.push_back(str.substr(pos, eol - pos));
    pos = eol + 1;
  }
  return lines;
}

}  // namespace

std::string trim(const std::string& str) {
  size_t start = str.find_first_not_of(kWhitespace);
  if (start == std::string::npos) {
    return std::string();
  }
  size_t end = str.find_last_not_of(kWhitespace);
  return str.substr(start, end - start + 1);
}

std::vector<size_t> indexStringAll(const std::string& str,
                                   const std::string& searched) {
  std::vector<size_t> found;
  if (searched.empty()) {
    return found;
  }
  size_t pos = str.find(searched);
  while (pos != std::string::npos) {
    found.push_back(pos);
    pos = str.find(searched, pos + searched.size());
  }
  return found;
}

std::vector<std::string> splitIgnoreGroups(const std::string& str,
                                           const std::string& sep) {
  if (str.empty()) {
    return {};
  }
  if (sep.empty()) {
    return {str};
  }

  bool honour_groups =
      std::count(str.begin(), str.end(), '{') ==
          std::count(str.begin(), str.end(), '}') &&
      std::count(str.begin(), str.end(), '[') ==
          std::count(str.begin(), str.end(), ']');

  std::vector<std::string> parts;
  int curly_depth = 0;
  int bracket_depth = 0;
  size_t field_start = 0;
  size_t i = 0;
  while (i < str.size()) {
    char c = str[i];
    if (honour_groups) {
      if (c == '{') {
        ++curly_depth;
      } else if (c == '}' && curly_depth > 0) {
        --curly_depth;
      } else if (c == '[') {
        ++bracket_depth;
      } else if (c == ']' && bracket_depth > 0) {
        --bracket_depth;
      }
    }
    bool grouped = curly_depth > 0 || bracket_depth > 0;
    if (!grouped && str.compare(i, sep.size(), sep) == 0) {
      parts.push_back(str.substr(field_start, i - field_start));
      i += sep.size();
      field_start = i;
      continue;
    }
    ++i;
  }
  parts.push_back(str.substr(field_start));
  return parts;
}

std::string headerValue(const std::string& header_block,
                        const std::string& name) {
  if (name.empty()) {
    return std::string();
  }
  for (const auto& line : splitLines(header_block)) {
    if (line.size() > name.size() && line.compare(0, name.size(), name) == 0 &&
        line[name.size()] == ':') {
      return trim(line.substr(name.size() + 1));
    }
  }
  return std::string();
}

std::string urlDecode(const std::string& value) {
  std::string decoded;
  decoded.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '+') {
      decoded += ' ';
    } else if (c == '%') {
      if (i + 2 >= value.size()) {
        return value;
      }
      int hi = hexValue(value[i + 1]);
      int lo = hexValue(value[i + 2]);
      if (hi < 0 || lo < 0) {
        return value;
      }
      decoded += static_cast<char>(hi * 16 + lo);
      i += 2;
    } else {
      decoded += c;
    }
  }
  return decoded;
}

std::map<std::string, std::string> eventStrToMap(
    const std::string& event, const std::vector<std::string>& excluded) {
  std::map<std::string, std::string> fields;
  for (const auto& line : splitLines(event)) {
    size_t sep = line.find(": ");
    if (sep == std::string::npos) {
      continue;
    }
    std::string name = line.substr(0, sep);
    if (std::find(excluded.begin(), excluded.end(), name) != excluded.end()) {
      continue;
    }
    fields[name] = urlDecode(trim(line.substr(sep + 2)));
  }
  return fields;
}

std::vector<std::map<std::string, std::string>> mapChanData(
    const std::string& listing) {
  std::vector<std::map<std::string, std::string>> rows;
  std::vector<std::string> lines = splitLines(listing);
  if (lines.size() <= 5) {
    return rows;
  }

  std::vector<std::string> columns = splitIgnoreGroups(lines[0], ",");
  for (size_t i = 1; i + 3 < lines.size(); ++i) {
    std::vector<std::string> values = splitIgnoreGroups(lines[i], ",");
    if (values.size() != columns.size()) {
      continue;
    }
    std::map<std::string, std::string> row;
    for (size_t c = 0; c < columns.size(); ++c) {
      row[columns[c]] = values[c];
    }
    rows.push_back(std::move(row));
  }
  return rows;
}

}  // namespace esl
}  // namespace fsesl
