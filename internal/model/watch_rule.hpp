#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace logship::model {

/*
  One configured log directory.

  allow_deletion=false is a hard veto on deleting anything under root.
*/
struct WatchRule {
  std::filesystem::path root;
  std::string           source;
  std::string           pattern; // fnmatch glob on the file name, empty matches all
  bool                  recursive{true};
  bool                  allow_deletion{true};
};

// Lexically normal root without a trailing separator.
std::filesystem::path NormalizeRoot(const std::filesystem::path& root);

// Path of file below rule.root, or nullopt when file is not under it.
std::optional<std::filesystem::path> RelativeToRoot(const WatchRule& rule, const std::filesystem::path& file);

bool MatchesPattern(const WatchRule& rule, const std::filesystem::path& file);

// True when file sits directly in root, or anywhere below it for recursive rules.
bool WithinDepth(const WatchRule& rule, const std::filesystem::path& file);

// Dot-files, including our own temporary documents.
bool IsHidden(const std::filesystem::path& file);

/*
  Maps a path to the rule that governs it. The most specific (longest)
  root wins when roots nest.
*/
class RuleMatcher {
 public:
  explicit RuleMatcher(std::vector<WatchRule> rules);

  const WatchRule* Find(const std::filesystem::path& file) const;

  // Find() plus depth, pattern and hidden-file checks: should file be shipped.
  const WatchRule* Candidate(const std::filesystem::path& file) const;

  const std::vector<WatchRule>& rules() const {
    return rules_;
  }

 private:
  std::vector<WatchRule> rules_;
};

} // namespace logship::model
