#include "internal/migration/naming.hpp"

#include <charconv>
#include <system_error>

namespace strata::migration {

std::string NamingScheme::FileName(std::uint64_t version) const {
  return prefix + separator + std::to_string(version) + suffix;
}

std::optional<std::uint64_t> NamingScheme::ParseVersion(std::string_view file_name) const {
  const auto head = prefix + separator;
  if (file_name.size() <= head.size() + suffix.size()) return std::nullopt;
  if (!file_name.starts_with(head) || !file_name.ends_with(suffix)) return std::nullopt;

  auto digits = file_name.substr(head.size(), file_name.size() - head.size() - suffix.size());

  std::uint64_t version = 0;
  auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), version);
  if (ec != std::errc() || ptr != digits.data() + digits.size()) return std::nullopt;
  return version;
}

} // namespace strata::migration
