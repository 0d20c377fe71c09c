#include "cli/options.hpp"

#include "wtmirror/mirror.hpp"

#include <filesystem>
#include <iostream>

int cmd_detect(int argc, char **argv) {
  const auto args = wtmirror::cli::parse_args(argc, argv);
  if (!args || args->positional.size() != 1) {
    std::cerr << "usage: wtmirror detect <root> [--depth N] [--config <file>]\n";
    return 2;
  }
  const std::filesystem::path root = args->positional[0];

  try {
    const auto settings = wtmirror::cli::settings_for(*args);
    const auto classifier = wtmirror::make_classifier(settings);
    const int depth = args->depth.value_or(settings.virtual_env_handling.max_scan_depth);

    const auto detected = classifier.detect_all(root, depth);
    if (detected.empty()) {
      std::cout << "No virtual environments detected\n";
      return 0;
    }
    for (const auto &d : detected)
      std::cout << "  - " << d.ecosystem << ": " << d.path << "  (" << d.pattern << ")\n";
    std::cout << "\n";
    for (const auto &line : classifier.suggest_setup_commands(detected))
      std::cout << line << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "detect: " << e.what() << "\n";
    return 1;
  }
}
