#include "strings.hpp"

#include <cctype>

namespace claimstone::util {

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

std::vector<std::string_view> Split(std::string_view s, char delimiter) {
  std::vector<std::string_view> out;
  std::size_t                   start = 0;
  while (true) {
    const auto pos = s.find(delimiter, start);
    if (pos == std::string_view::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, pos - start));
    start = pos + 1;
  }

  if (out.size() > 1) {
    while (!out.empty() && out.back().empty()) out.pop_back();
  }
  return out;
}

} // namespace claimstone::util
