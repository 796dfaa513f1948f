#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace claimstone::util {

// ASCII case-insensitive equality.
bool EqualsIgnoreCase(std::string_view a, std::string_view b);

// Splits on every delimiter. Inner empty segments are kept ("a..b" -> a,"",b),
// trailing ones are dropped ("a.b." -> a,b). Without a delimiter the input is
// the only segment, even when empty.
std::vector<std::string_view> Split(std::string_view s, char delimiter);

} // namespace claimstone::util
