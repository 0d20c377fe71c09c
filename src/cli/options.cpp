#include "cli/options.hpp"

#include <charconv>
#include <iostream>
#include <string_view>

namespace wtmirror::cli {

std::optional<CommandArgs> parse_args(int argc, char **argv) {
  CommandArgs out;
  for (int i = 1; i < argc; ++i) {
    const std::string_view a = argv[i];
    if (a == "--config" || a == "-c") {
      if (i + 1 >= argc) {
        std::cerr << argv[0] << ": " << a << " needs a file\n";
        return std::nullopt;
      }
      out.config = argv[++i];
    } else if (a == "--depth") {
      if (i + 1 >= argc) {
        std::cerr << argv[0] << ": --depth needs a number\n";
        return std::nullopt;
      }
      const std::string_view v = argv[++i];
      int n = 0;
      const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
      if (ec != std::errc{} || ptr != v.data() + v.size() || n < -1) {
        std::cerr << argv[0] << ": bad --depth value: " << v << "\n";
        return std::nullopt;
      }
      out.depth = n;
    } else {
      out.positional.emplace_back(a);
    }
  }
  return out;
}

Settings settings_for(const CommandArgs &args) {
  if (args.config)
    return load_settings(*args.config);
  return load_default_settings();
}

} // namespace wtmirror::cli
