#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/runner.hpp"

namespace strata::cli {

enum class CommandKind {
  kUp,
  kDown,
  kForceUp,
  kForceDown,
  kBlank,
  kStats,
  kHelp,
};

struct Command {
  CommandKind kind = CommandKind::kHelp;

  // kUp / kDown only.
  core::Steps steps;

  // kForceUp / kForceDown only.
  uint64_t version = 0;
};

class UsageError : public std::runtime_error {
 public:
  explicit UsageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Parses the arguments following the program name:

    up         [--steps=N|all]     default all
    down       [--steps=N|all]     default 1
    force:up   --version=V
    force:down --version=V
    blank
    stats
    help

  No arguments means help. Throws UsageError for anything else.
*/
Command ParseCommand(const std::vector<std::string>& args);

} // namespace strata::cli
