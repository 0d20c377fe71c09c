#include "wtmirror/virtualenv.hpp"

#include <iostream>
#include <string>
#include <vector>

int main() {
  const wtmirror::VirtualEnvClassifier c;

  struct Case {
    const char *path;
    bool expect;
  };
  const std::vector<Case> cases = {
      {"node_modules/foo", true},
      {"src/node_modules_backup", false},
      {"app/.venv/lib/site.py", true},
      {"Node_Modules/x", true},        // case-insensitive
      {"vendor/bundle/ruby", true},
      {"lib/vendor/bundle", true},     // "vendor" segment on its own
      {"vendor_old/bundle", false},
      {"./app/../node_modules", true}, // normalized first
      {"src/main.rs", false},
      {".env", false},
      {"environment/config", false},
  };
  for (const auto &[path, expect] : cases) {
    if (c.is_virtual_env(path) != expect) {
      std::cerr << "is_virtual_env(" << path << ") expected " << expect << "\n";
      return 1;
    }
  }

  // slash patterns match only from the root
  std::vector<wtmirror::VirtualEnvGroup> extra;
  extra.push_back({.ecosystem = "Deno", .patterns = {"cache/deno"}, .setup_hints = {"deno cache"}});
  const wtmirror::VirtualEnvClassifier custom{extra};
  if (!custom.is_virtual_env("cache/deno/x.js") || custom.is_virtual_env("src/cache/deno")) {
    std::cerr << "prefix pattern semantics wrong\n";
    return 1;
  }
  if (custom.is_virtual_env("cache/denoland")) {
    std::cerr << "prefix pattern must stop at a segment boundary\n";
    return 1;
  }

  // custom groups come after the built-ins
  if (custom.groups().size() != wtmirror::builtin_virtual_env_groups().size() + 1 ||
      custom.groups().back().ecosystem != "Deno") {
    std::cerr << "custom group not appended\n";
    return 1;
  }

  // exclude patterns: de-duplicated, group order
  const auto ex = c.exclude_patterns();
  int vendors = 0;
  for (const auto &p : ex)
    vendors += p == "vendor" ? 1 : 0;
  if (vendors != 1 || ex.front() != ".venv") {
    std::cerr << "exclude patterns not de-duplicated\n";
    return 1;
  }

  // setup suggestions: one block per ecosystem
  const std::vector<wtmirror::DetectedVirtualEnv> det = {
      {.ecosystem = "Node.js", .path = "node_modules", .pattern = "node_modules"},
      {.ecosystem = "Node.js", .path = "web/node_modules", .pattern = "node_modules"},
      {.ecosystem = "Rust", .path = "target", .pattern = "target"},
  };
  const auto lines = c.suggest_setup_commands(det);
  const std::vector<std::string> want = {"# Node.js: Choose one of the following:",
                                         "  npm install",
                                         "  pnpm install",
                                         "  yarn install",
                                         "# Rust: Choose one of the following:",
                                         "  cargo build"};
  if (lines != want) {
    std::cerr << "setup suggestions mismatch\n";
    for (const auto &l : lines)
      std::cerr << "  [" << l << "]\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}
