#include <solid/escaping.h>

namespace solid {

std::string EscapeField(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '\\':
      escaped.append("\\\\");
      break;
    case '\t':
      escaped.append("\\t");
      break;
    case '\n':
      escaped.append("\\n");
      break;
    case '\r':
      escaped.append("\\r");
      break;
    default:
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string UnescapeField(const std::string &value) {
  std::string unescaped;
  unescaped.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (value[i] != '\\' || i + 1 >= value.size()) {
      unescaped.push_back(value[i]);
      continue;
    }
    const auto next = value[++i];
    if (next == 't') {
      unescaped.push_back('\t');
    } else if (next == 'n') {
      unescaped.push_back('\n');
    } else if (next == 'r') {
      unescaped.push_back('\r');
    } else {
      unescaped.push_back(next);
    }
  }
  return unescaped;
}

std::vector<std::string> SplitRecord(const std::string &line) {
  std::vector<std::string> fields;
  std::string current;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (line[i] == '\\' && i + 1 < line.size()) {
      current.push_back(line[i]);
      current.push_back(line[++i]);
      continue;
    }
    if (line[i] == '\t') {
      fields.push_back(UnescapeField(current));
      current.clear();
      continue;
    }
    current.push_back(line[i]);
  }
  fields.push_back(UnescapeField(current));
  return fields;
}

std::string JoinRecord(const std::vector<std::string> &fields) {
  std::string line;
  for (std::size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      line.push_back('\t');
    }
    line.append(EscapeField(fields[i]));
  }
  return line;
}

} // namespace solid
