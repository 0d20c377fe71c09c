#include "cli/registry.hpp"

int cmd_copy(int argc, char **argv);
int cmd_scan(int argc, char **argv);
int cmd_detect(int argc, char **argv);

namespace wtmirror::cli {

void register_all_commands() {
  register_command("copy", ::cmd_copy,
                   "Mirror untracked files into a worktree: wtmirror copy <source> <target> "
                   "[--config <file>]");
  register_command("scan", ::cmd_scan,
                   "List files that would be mirrored: wtmirror scan <root> [--config <file>]");
  register_command("detect", ::cmd_detect,
                   "Report virtual environments: wtmirror detect <root> [--depth N] "
                   "[--config <file>]");
}

} // namespace wtmirror::cli
