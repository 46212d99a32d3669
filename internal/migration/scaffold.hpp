#pragma once

#include <cstdint>
#include <filesystem>

#include "internal/migration/naming.hpp"

namespace strata::migration {

/*
  Writes a blank migration source file for `version` into `directory`.

  The file holds a skeleton class implementing Migration plus a factory
  function to add to the composition root's migration list. Never
  overwrites: throws std::runtime_error if the file already exists or can't
  be written. Returns the created path.
*/
std::filesystem::path CreateBlankMigration(const std::filesystem::path& directory, const NamingScheme& naming,
                                           std::uint64_t version);

} // namespace strata::migration
