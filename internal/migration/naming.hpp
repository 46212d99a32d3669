#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace strata::migration {

/*
  Migration source file naming convention:

    <prefix><separator><decimal version><suffix>      e.g. version_1712953077.cpp

  One migration definition per file.
*/
struct NamingScheme {
  std::string prefix    = "version";
  std::string separator = "_";
  std::string suffix    = ".cpp";

  std::string FileName(std::uint64_t version) const;

  // Version encoded in file_name, or nullopt if the name does not follow
  // the scheme (wrong prefix/suffix, non-digits, overflow).
  std::optional<std::uint64_t> ParseVersion(std::string_view file_name) const;
};

} // namespace strata::migration
