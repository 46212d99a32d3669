#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include "internal/migration/migration.hpp"

namespace strata::migration {

/*
  In-memory catalog of migrations keyed by version.

  Built once at startup by the composition root and read-only afterwards.
  Ordering is computed on demand; versions are unique so the order is total.
*/
class Registry {
 public:
  Registry()          = default;
  virtual ~Registry() = default;

  Registry(const Registry&)            = delete;
  Registry& operator=(const Registry&) = delete;

  // Throws util::DuplicateVersion if the version is already registered.
  void Register(std::shared_ptr<Migration> migration);

  std::vector<std::uint64_t>              OrderedVersions() const;
  std::vector<std::shared_ptr<Migration>> OrderedMigrations() const;

  // nullptr when the version is not registered.
  std::shared_ptr<Migration> Get(std::uint64_t version) const;

  bool        Contains(std::uint64_t version) const;
  std::size_t Count() const;

 private:
  std::unordered_map<std::uint64_t, std::shared_ptr<Migration>> migrations_;
};

} // namespace strata::migration
