#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace claimstone::service {

/*
  One sub-command of the base command (/ps <name> ...). Parsing and
  execution belong to the command layer; the core only keeps the list.
*/
class CommandArgument {
 public:
  virtual ~CommandArgument() = default;

  // First entry is the primary name, the rest are aliases.
  virtual std::vector<std::string> Names() const = 0;

  virtual bool Execute(const std::vector<std::string>& args) = 0;
};

class CommandRegistry {
 public:
  // Throws util::InvalidState if a name is already taken.
  void Register(std::unique_ptr<CommandArgument> argument);

  // Case-insensitive over every name of every argument.
  CommandArgument* Find(std::string_view name) const;

  const std::vector<std::unique_ptr<CommandArgument>>& Arguments() const {
    return arguments_;
  }

 private:
  std::vector<std::unique_ptr<CommandArgument>> arguments_;
};

} // namespace claimstone::service
