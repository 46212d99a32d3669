#include "internal/migration/directory_registry.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>
#include <string>
#include <unordered_set>
#include <utility>

#include "internal/util/errors.hpp"

namespace strata::migration {

DirectoryRegistry::DirectoryRegistry(std::filesystem::path directory, NamingScheme naming)
    : directory_(std::move(directory)), naming_(std::move(naming)) {
  std::error_code ec;
  if (!std::filesystem::is_directory(directory_, ec)) {
    throw std::invalid_argument("invalid migrations path: " + directory_.string() + " is not a directory");
  }
}

std::shared_ptr<DirectoryRegistry> DirectoryRegistry::Build(std::filesystem::path directory, NamingScheme naming,
                                                            const std::vector<std::shared_ptr<Migration>>& migrations) {
  auto registry = std::make_shared<DirectoryRegistry>(std::move(directory), std::move(naming));
  for (const auto& migration : migrations) {
    registry->Register(migration);
  }
  registry->AssertValid();
  return registry;
}

ValidationReport DirectoryRegistry::HasAllMigrationsRegistered() const {
  auto                              registered = OrderedVersions();
  std::unordered_set<std::uint64_t> unmatched(registered.begin(), registered.end());

  ValidationReport report;
  for (const auto& entry : std::filesystem::directory_iterator(directory_)) {
    if (!entry.is_regular_file()) continue;

    // only the canonical spelling declares a version; version_03.cpp does not
    const auto name    = entry.path().filename().string();
    auto       version = naming_.ParseVersion(name);
    if (!version || naming_.FileName(*version) != name) continue;

    if (unmatched.erase(*version) == 0) {
      report.missing.push_back(*version);
    }
  }

  report.extra.assign(unmatched.begin(), unmatched.end());
  std::sort(report.missing.begin(), report.missing.end());
  std::sort(report.extra.begin(), report.extra.end());

  report.all_registered = report.missing.empty() && report.extra.empty();
  return report;
}

void DirectoryRegistry::AssertValid() const {
  ValidationReport report;
  try {
    report = HasAllMigrationsRegistered();
  } catch (const std::filesystem::filesystem_error& e) {
    throw util::InconsistentRegistry(std::string("registry has invalid state: ") + e.what());
  }

  if (report.all_registered) return;

  throw util::InconsistentRegistry(
      "registry has invalid state. You must register all migrations before running migrations. Not registered: " +
      JoinFileNames(report.missing) + ". Extra migrations: " + JoinFileNames(report.extra));
}

std::string DirectoryRegistry::JoinFileNames(const std::vector<std::uint64_t>& versions) const {
  if (versions.empty()) return "none";

  std::string out;
  for (auto version : versions) {
    if (!out.empty()) out += ", ";
    out += naming_.FileName(version);
  }
  return out;
}

} // namespace strata::migration
