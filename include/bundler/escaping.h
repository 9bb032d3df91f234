#pragma once

#include <string>
#include <vector>

namespace bundler {

std::string XmlEscape(const std::string &value);
std::string ShellQuote(const std::string &value);
std::string JoinCommandLine(const std::string &program,
                            const std::vector<std::string> &args);

} // namespace bundler
