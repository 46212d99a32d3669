#include "internal/migration/registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace strata::migration {

void Registry::Register(std::shared_ptr<Migration> migration) {
  if (!migration) {
    throw std::invalid_argument("cannot register a null migration");
  }

  const auto version = migration->Version();
  if (migrations_.contains(version)) {
    throw util::DuplicateVersion(version, "failed to register migration " + std::to_string(version) + ": version is already registered");
  }

  migrations_.emplace(version, std::move(migration));
}

std::vector<std::uint64_t> Registry::OrderedVersions() const {
  std::vector<std::uint64_t> versions;
  versions.reserve(migrations_.size());
  for (const auto& [version, _] : migrations_) {
    versions.push_back(version);
  }
  std::sort(versions.begin(), versions.end());
  return versions;
}

std::vector<std::shared_ptr<Migration>> Registry::OrderedMigrations() const {
  std::vector<std::shared_ptr<Migration>> ordered;
  ordered.reserve(migrations_.size());
  for (auto version : OrderedVersions()) {
    ordered.push_back(migrations_.at(version));
  }
  return ordered;
}

std::shared_ptr<Migration> Registry::Get(std::uint64_t version) const {
  auto it = migrations_.find(version);
  if (it == migrations_.end()) return nullptr;
  return it->second;
}

bool Registry::Contains(std::uint64_t version) const {
  return migrations_.contains(version);
}

std::size_t Registry::Count() const {
  return migrations_.size();
}

} // namespace strata::migration
