#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/result.hpp"

namespace strata::util {

/*
  Central error types.

  Everything here is fatal to the current command; the CLI maps them to a
  non-zero exit status. Step failures are reported through RunReport instead.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateVersion : public std::runtime_error {
 public:
  DuplicateVersion(std::uint64_t version, const std::string& msg) : std::runtime_error(msg), version_(version) {
  }

  std::uint64_t version() const {
    return version_;
  }

 private:
  std::uint64_t version_;
};

class InconsistentRegistry : public std::runtime_error {
 public:
  explicit InconsistentRegistry(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Ledger holds executions for versions the registry does not know.
class InconsistentLedger : public std::runtime_error {
 public:
  InconsistentLedger(std::vector<std::uint64_t> orphaned, const std::string& msg)
      : std::runtime_error(msg), orphaned_(std::move(orphaned)) {
  }

  const std::vector<std::uint64_t>& orphaned() const {
    return orphaned_;
  }

 private:
  std::vector<std::uint64_t> orphaned_;
};

class StorageError : public std::runtime_error {
 public:
  StorageError(Result result, const std::string& msg) : std::runtime_error(msg), result_(std::move(result)) {
  }

  const Result& result() const {
    return result_;
  }

 private:
  Result result_;
};

class LockConflict : public std::runtime_error {
 public:
  explicit LockConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace strata::util
