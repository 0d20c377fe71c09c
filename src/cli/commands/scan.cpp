#include "cli/options.hpp"

#include "wtmirror/git_index.hpp"
#include "wtmirror/mirror.hpp"
#include "wtmirror/scanner.hpp"

#include <filesystem>
#include <iostream>

int cmd_scan(int argc, char **argv) {
  const auto args = wtmirror::cli::parse_args(argc, argv);
  if (!args || args->positional.size() != 1) {
    std::cerr << "usage: wtmirror scan <root> [--config <file>]\n";
    return 2;
  }
  const std::filesystem::path root = std::filesystem::absolute(args->positional[0]);

  try {
    const auto settings = wtmirror::cli::settings_for(*args);
    if (!settings.copy_ignored_files.enabled) {
      std::cout << "copying of ignored files is disabled\n";
      return 0;
    }
    wtmirror::GitIndex index{root};
    index.load();
    if (index.in_repository() && !index.index_loaded())
      std::cerr << "scan: warning: git index unreadable, tracked files taken from HEAD\n";

    const auto classifier = wtmirror::make_classifier(settings);
    const auto policy = wtmirror::make_policy(settings, classifier);
    for (const auto &rel :
         wtmirror::scan_directory(root, policy, index.as_predicate(), classifier)) {
      std::cout << rel << "\n";
    }
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "scan: " << e.what() << "\n";
    return 1;
  }
}
