#include "internal/cli/command.hpp"

#include <charconv>
#include <optional>
#include <string_view>
#include <system_error>

namespace strata::cli {
namespace {

constexpr std::string_view kStepsFlag   = "--steps=";
constexpr std::string_view kVersionFlag = "--version=";

std::optional<uint64_t> ParseUnsigned(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }

  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string_view> FlagValue(std::string_view arg, std::string_view flag) {
  if (arg.substr(0, flag.size()) != flag) {
    return std::nullopt;
  }
  return arg.substr(flag.size());
}

core::Steps ParseSteps(const std::vector<std::string>& args, core::Steps fallback) {
  if (args.size() == 1) {
    return fallback;
  }
  if (args.size() > 2) {
    throw UsageError("too many arguments for '" + args[0] + "'");
  }

  auto value = FlagValue(args[1], kStepsFlag);
  if (!value) {
    throw UsageError("unknown option '" + args[1] + "' for '" + args[0] + "'");
  }
  if (*value == "all") {
    return core::Steps::All();
  }

  auto count = ParseUnsigned(*value);
  if (!count) {
    throw UsageError("--steps expects a non-negative integer or 'all', got '" + std::string(*value) + "'");
  }
  return core::Steps::Count(static_cast<std::size_t>(*count));
}

uint64_t ParseVersion(const std::vector<std::string>& args) {
  if (args.size() != 2) {
    throw UsageError("'" + args[0] + "' requires exactly one --version=V option");
  }

  auto value = FlagValue(args[1], kVersionFlag);
  if (!value) {
    throw UsageError("unknown option '" + args[1] + "' for '" + args[0] + "'");
  }

  auto version = ParseUnsigned(*value);
  if (!version) {
    throw UsageError("--version expects an unsigned integer, got '" + std::string(*value) + "'");
  }
  return *version;
}

void RequireNoOptions(const std::vector<std::string>& args) {
  if (args.size() > 1) {
    throw UsageError("'" + args[0] + "' takes no options");
  }
}

} // namespace

Command ParseCommand(const std::vector<std::string>& args) {
  Command command;
  if (args.empty()) {
    return command;
  }

  const auto& name = args[0];

  if (name == "up") {
    command.kind  = CommandKind::kUp;
    command.steps = ParseSteps(args, core::Steps::All());
    return command;
  }

  // reverting is destructive; one step unless asked for more
  if (name == "down") {
    command.kind  = CommandKind::kDown;
    command.steps = ParseSteps(args, core::Steps::Count(1));
    return command;
  }

  if (name == "force:up") {
    command.kind    = CommandKind::kForceUp;
    command.version = ParseVersion(args);
    return command;
  }

  if (name == "force:down") {
    command.kind    = CommandKind::kForceDown;
    command.version = ParseVersion(args);
    return command;
  }

  if (name == "blank") {
    RequireNoOptions(args);
    command.kind = CommandKind::kBlank;
    return command;
  }

  if (name == "stats") {
    RequireNoOptions(args);
    command.kind = CommandKind::kStats;
    return command;
  }

  if (name == "help" || name == "--help" || name == "-h") {
    command.kind = CommandKind::kHelp;
    return command;
  }

  throw UsageError("unknown command '" + name + "'");
}

} // namespace strata::cli
