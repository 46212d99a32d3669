#include "internal/migration/scaffold.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>
#include <system_error>

namespace strata::migration {

namespace {

std::string RenderTemplate(std::uint64_t version) {
  const auto v = std::to_string(version);

  std::string out;
  out += "#include <cstdint>\n";
  out += "#include <memory>\n\n";
  out += "#include \"internal/migration/migration.hpp\"\n\n";
  out += "namespace migrations {\n\n";
  out += "class Migration" + v + " final : public strata::migration::Migration {\n";
  out += " public:\n";
  out += "  std::uint64_t Version() const override {\n";
  out += "    return " + v + ";\n";
  out += "  }\n\n";
  out += "  strata::util::Result Up(const strata::migration::Context&) override {\n";
  out += "    return strata::util::Result::Ok();\n";
  out += "  }\n\n";
  out += "  strata::util::Result Down(const strata::migration::Context&) override {\n";
  out += "    return strata::util::Result::Ok();\n";
  out += "  }\n";
  out += "};\n\n";
  out += "std::shared_ptr<strata::migration::Migration> MakeMigration" + v + "() {\n";
  out += "  return std::make_shared<Migration" + v + ">();\n";
  out += "}\n\n";
  out += "} // namespace migrations\n";
  return out;
}

} // namespace

std::filesystem::path CreateBlankMigration(const std::filesystem::path& directory, const NamingScheme& naming,
                                           std::uint64_t version) {
  const auto path = directory / naming.FileName(version);

  // "x" fails if the file exists
  std::FILE* file = std::fopen(path.c_str(), "wx");
  if (file == nullptr) {
    throw std::runtime_error("failed to create migration file " + path.string());
  }

  const auto body    = RenderTemplate(version);
  const auto written = std::fwrite(body.data(), 1, body.size(), file);
  const auto closed  = std::fclose(file);

  if (written != body.size() || closed != 0) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    throw std::runtime_error("failed to write migration file " + path.string());
  }

  return path;
}

} // namespace strata::migration
