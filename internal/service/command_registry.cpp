#include "command_registry.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace claimstone::service {

void CommandRegistry::Register(std::unique_ptr<CommandArgument> argument) {
  if (!argument) throw util::InvalidState("register command: null argument");

  const auto names = argument->Names();
  if (names.empty()) throw util::InvalidState("register command: argument has no name");

  for (const auto& name : names) {
    if (Find(name)) throw util::InvalidState("register command: name already registered: " + name);
  }
  arguments_.push_back(std::move(argument));
}

CommandArgument* CommandRegistry::Find(std::string_view name) const {
  for (const auto& argument : arguments_) {
    for (const auto& candidate : argument->Names()) {
      if (util::EqualsIgnoreCase(candidate, name)) return argument.get();
    }
  }
  return nullptr;
}

} // namespace claimstone::service
