#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string_view>

#include "internal/model/watch_rule.hpp"

namespace logship::cleanup {

enum class Gate {
  kSystemPath,
  kAllowDeletion,
  kRecursive,
  kPattern,
};

std::string_view ToString(Gate gate);

using GatePredicate = bool (*)(const std::filesystem::path& file, const model::WatchRule& rule);

/*
  Gate 1. False for anything inside a protected system tree, directly in
  a protected directory, or whose resolved path leaves the rule root.
*/
bool SystemPathGate(const std::filesystem::path& file, const model::WatchRule& rule);

// Gate 2. The rule's allow_deletion flag.
bool AllowDeletionGate(const std::filesystem::path& file, const model::WatchRule& rule);

// Gate 3. Non-recursive rules only own files directly in their root.
bool RecursiveGate(const std::filesystem::path& file, const model::WatchRule& rule);

// Gate 4. The rule's glob, when it has one.
bool PatternGate(const std::filesystem::path& file, const model::WatchRule& rule);

struct GateEntry {
  Gate          gate;
  GatePredicate predicate;
};

// Evaluation order.
inline constexpr std::array<GateEntry, 4> kDeletionGates{{
    {Gate::kSystemPath, &SystemPathGate},
    {Gate::kAllowDeletion, &AllowDeletionGate},
    {Gate::kRecursive, &RecursiveGate},
    {Gate::kPattern, &PatternGate},
}};

// First gate that says no, or nullopt when every gate passes.
std::optional<Gate> FirstVeto(const std::filesystem::path& file, const model::WatchRule& rule);

bool IsProtectedSystemPath(const std::filesystem::path& path);

} // namespace logship::cleanup
