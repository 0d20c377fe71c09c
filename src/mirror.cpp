#include "wtmirror/mirror.hpp"

#include "wtmirror/fs.hpp"

#include <thread>

namespace stdfs = std::filesystem;

namespace wtmirror {

namespace {

std::string join(const std::vector<std::string> &xs, std::string_view sep) {
  std::string out;
  for (const auto &x : xs) {
    if (!out.empty())
      out.append(sep);
    out.append(x);
  }
  return out;
}

} // namespace

VirtualEnvClassifier make_classifier(const Settings &settings) {
  return VirtualEnvClassifier{settings.virtual_env_handling.custom_patterns};
}

CopyPolicy make_policy(const Settings &settings, const VirtualEnvClassifier &classifier) {
  const bool isolate = settings.virtual_env_handling.isolate_virtual_envs;
  CopyPolicy policy{.include_patterns = settings.copy_ignored_files.patterns,
                    .exclude_patterns = settings.copy_ignored_files.exclude_patterns,
                    .isolation_enabled = isolate};
  if (isolate) {
    for (auto &p : classifier.exclude_patterns())
      policy.exclude_patterns.push_back(std::move(p));
  }
  return policy;
}

MirrorReport mirror_ignored_files(const stdfs::path &source, const stdfs::path &target,
                                  const Settings &settings, const TrackedPredicate &is_tracked) {
  MirrorReport report;
  const auto &veh = settings.virtual_env_handling;
  const VirtualEnvClassifier classifier = make_classifier(settings);

  if (settings.copy_ignored_files.enabled && !fs::same_location(source, target)) {
    const CopyPolicy policy = make_policy(settings, classifier);
    report.candidates = scan_directory(source, policy, is_tracked, classifier);

    if (!report.candidates.empty()) {
      CopyRequest req{.source_root = source,
                      .target_root = target,
                      .limits = copy_limits(veh),
                      .isolation_enabled = veh.isolate_virtual_envs,
                      .parallelism = effective_parallelism(veh.copy_parallelism,
                                                           std::thread::hardware_concurrency())};
      Copier copier{std::move(req), classifier};
      report.outcome = copier.run(report.candidates);
    }
  }

  if (veh.isolate_virtual_envs) {
    report.detected = classifier.detect_all(source, veh.max_scan_depth);
    report.setup_suggestions = classifier.suggest_setup_commands(report.detected);
  }
  return report;
}

std::vector<std::string> outcome_summary(const CopyOutcome &outcome) {
  std::vector<std::string> lines;
  if (!outcome.copied.empty()) {
    lines.push_back("Copied " + std::to_string(outcome.copied.size()) +
                    " ignored file(s): " + join(outcome.copied, ", "));
  }
  if (!outcome.skipped_virtual_envs.empty())
    lines.push_back("Skipped virtual environment(s): " + join(outcome.skipped_virtual_envs, ", "));
  if (!outcome.skipped_oversize.empty())
    lines.push_back("Skipped oversize file(s): " + join(outcome.skipped_oversize, ", "));
  return lines;
}

std::vector<std::string> report_lines(const MirrorReport &report) {
  auto lines = outcome_summary(report.outcome);
  if (report.detected.empty())
    return lines;

  lines.emplace_back();
  lines.emplace_back("Virtual environments detected in the source worktree:");
  for (const auto &d : report.detected)
    lines.push_back("  - " + d.ecosystem + ": " + d.path);
  lines.emplace_back();
  lines.emplace_back("To set up your development environment, run:");
  lines.insert(lines.end(), report.setup_suggestions.begin(), report.setup_suggestions.end());
  return lines;
}

} // namespace wtmirror
