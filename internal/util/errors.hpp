#pragma once

#include <stdexcept>
#include <string>

namespace claimstone::util {

/*
  Central error types.

  Store adapters report failures as db::Result codes; everything above the
  store boundary throws one of these.
*/

class ScopeNotFound : public std::runtime_error {
 public:
  explicit ScopeNotFound(const std::string& world) : std::runtime_error("unknown world: " + world), world_(world) {
  }

  const std::string& World() const {
    return world_;
  }

 private:
  std::string world_;
};

class DirectoryUnavailable : public std::runtime_error {
 public:
  explicit DirectoryUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidConfig : public std::runtime_error {
 public:
  explicit InvalidConfig(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace claimstone::util
