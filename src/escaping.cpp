#include <bundler/escaping.h>

namespace bundler {

std::string XmlEscape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    switch (character) {
    case '&':
      escaped.append("&amp;");
      continue;
    case '<':
      escaped.append("&lt;");
      continue;
    case '>':
      escaped.append("&gt;");
      continue;
    case '"':
      escaped.append("&quot;");
      continue;
    case '\'':
      escaped.append("&apos;");
      continue;
    default:
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string ShellQuote(const std::string &value) {
  if (value.empty()) {
    return "''";
  }
  const auto is_plain = value.find_first_not_of(
                            "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUV"
                            "WXYZ0123456789@%_+=:,./-") == std::string::npos;
  if (is_plain) {
    return value;
  }
  std::string quoted = "'";
  for (const auto character : value) {
    if (character == '\'') {
      quoted.append("'\\''");
      continue;
    }
    quoted.push_back(character);
  }
  quoted.push_back('\'');
  return quoted;
}

std::string JoinCommandLine(const std::string &program,
                            const std::vector<std::string> &args) {
  std::string line = ShellQuote(program);
  for (const auto &arg : args) {
    line.push_back(' ');
    line.append(ShellQuote(arg));
  }
  return line;
}

} // namespace bundler
