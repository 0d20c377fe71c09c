#pragma once
#include "wtmirror/settings.hpp"

#include <optional>
#include <string>
#include <vector>

namespace wtmirror::cli {

struct CommandArgs {
  std::vector<std::string> positional;
  std::optional<std::string> config; // --config <file>
  std::optional<int> depth;          // --depth <n>
};

// Parses argv[1..]; returns nullopt (after printing why) on a malformed flag
auto parse_args(int argc, char **argv) -> std::optional<CommandArgs>;

// --config file if given, else the default lookup
auto settings_for(const CommandArgs &args) -> Settings;

} // namespace wtmirror::cli
