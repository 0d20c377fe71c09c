#pragma once
#include "wtmirror/copier.hpp"
#include "wtmirror/scanner.hpp"
#include "wtmirror/settings.hpp"
#include "wtmirror/virtualenv.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace wtmirror {

struct MirrorReport {
  ScanResult candidates;
  CopyOutcome outcome;
  std::vector<DetectedVirtualEnv> detected; // only when isolation is enabled
  std::vector<std::string> setup_suggestions;
};

auto make_classifier(const Settings &settings) -> VirtualEnvClassifier;

// Scan policy from settings; with isolation on, every virtual-env pattern is
// appended to the exclude list.
auto make_policy(const Settings &settings, const VirtualEnvClassifier &classifier) -> CopyPolicy;

// Scan `source`, copy the candidates into `target`, and (with isolation on)
// detect the virtual environments left behind.
auto mirror_ignored_files(const std::filesystem::path &source, const std::filesystem::path &target,
                          const Settings &settings, const TrackedPredicate &is_tracked)
    -> MirrorReport;

// "Copied N ignored file(s): ...", "Skipped virtual environment(s): ...",
// "Skipped oversize file(s): ..." for each non-empty bucket
auto outcome_summary(const CopyOutcome &outcome) -> std::vector<std::string>;

// Outcome summary followed by the detection and setup sections
auto report_lines(const MirrorReport &report) -> std::vector<std::string>;

} // namespace wtmirror
