#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "internal/migration/naming.hpp"
#include "internal/migration/registry.hpp"

namespace strata::migration {

struct ValidationReport {
  bool all_registered = true;

  // Declared by a file in the directory but not registered. Ascending.
  std::vector<std::uint64_t> missing;

  // Registered but without a declaring file. Ascending.
  std::vector<std::uint64_t> extra;
};

/*
  Registry whose contents must match the migration source files found in a
  directory. A mismatch means the ordering of the run cannot be trusted, so
  AssertValid() is expected to run at startup before any command.
*/
class DirectoryRegistry final : public Registry {
 public:
  // Throws std::invalid_argument if directory is not an existing directory.
  explicit DirectoryRegistry(std::filesystem::path directory, NamingScheme naming = {});

  // Registers every migration and asserts the result is consistent.
  static std::shared_ptr<DirectoryRegistry> Build(std::filesystem::path directory, NamingScheme naming,
                                                  const std::vector<std::shared_ptr<Migration>>& migrations);

  // Compares registered versions with declared files in one pass over the
  // directory. Only a regular file named exactly naming.FileName(v) declares
  // v. Throws std::filesystem::filesystem_error if it can't be read.
  ValidationReport HasAllMigrationsRegistered() const;

  // Throws util::InconsistentRegistry listing both missing and extra files.
  void AssertValid() const;

  const std::filesystem::path& Directory() const {
    return directory_;
  }
  const NamingScheme& Naming() const {
    return naming_;
  }

 private:
  std::string JoinFileNames(const std::vector<std::uint64_t>& versions) const;

  std::filesystem::path directory_;
  NamingScheme          naming_;
};

} // namespace strata::migration
