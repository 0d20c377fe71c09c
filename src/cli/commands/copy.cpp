#include "cli/options.hpp"

#include "wtmirror/git_index.hpp"
#include "wtmirror/mirror.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

int cmd_copy(int argc, char **argv) {
  const auto args = wtmirror::cli::parse_args(argc, argv);
  if (!args || args->positional.size() != 2) {
    std::cerr << "usage: wtmirror copy <source> <target> [--config <file>]\n";
    return 2;
  }
  const std::filesystem::path source = std::filesystem::absolute(args->positional[0]);
  const std::filesystem::path target = std::filesystem::absolute(args->positional[1]);
  std::error_code ec;
  if (!std::filesystem::is_directory(source, ec)) {
    std::cerr << "copy: source is not a directory: " << source << "\n";
    return 1;
  }
  if (!std::filesystem::is_directory(target, ec)) {
    std::cerr << "copy: target is not a directory: " << target << "\n";
    return 1;
  }

  try {
    const auto settings = wtmirror::cli::settings_for(*args);
    wtmirror::GitIndex index{source};
    index.load();
    if (index.in_repository() && !index.index_loaded())
      std::cerr << "copy: warning: git index unreadable, tracked files taken from HEAD\n";

    const auto report =
        wtmirror::mirror_ignored_files(source, target, settings, index.as_predicate());
    const auto lines = wtmirror::report_lines(report);
    if (report.outcome.copied.empty())
      std::cout << "No ignored files copied\n";
    for (const auto &line : lines)
      std::cout << line << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "copy: " << e.what() << "\n";
    return 1;
  }
}
