#include "principal_ref.hpp"

namespace claimstone::model {

PrincipalRef ParsePrincipal(const std::string& raw) {
  if (auto id = util::TryParse(raw)) {
    return ById{*id};
  }
  return ByName{raw};
}

std::string FormatPrincipal(const PrincipalRef& ref) {
  if (const auto* by_id = std::get_if<ById>(&ref)) {
    return util::ToString(by_id->id);
  }
  return std::get<ByName>(ref).name;
}

} // namespace claimstone::model
