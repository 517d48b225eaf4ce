#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>

enum class ConflictPolicy {
    Skip,
    Overwrite,
    Rename,
    Ask
};

enum class ConflictDecision {
    Skip,
    Overwrite,
    Rename
};

// Called before each file copy whose destination already exists
using ConflictResolver = std::function<ConflictDecision(const std::filesystem::path& source,
                                                        const std::filesystem::path& destination)>;

std::string toString(ConflictPolicy policy);
std::string toString(ConflictDecision decision);
std::optional<ConflictPolicy> conflictPolicyFromString(const std::string& name);

// Builds a resolver for a configured policy. Ask delegates to askUser,
// falling back to Skip when no one is there to ask.
ConflictResolver makeConflictResolver(ConflictPolicy policy, ConflictResolver askUser = nullptr);

// Evaluates resolver, treating an empty resolver as Skip
ConflictDecision resolveConflict(const ConflictResolver& resolver,
                                 const std::filesystem::path& source,
                                 const std::filesystem::path& destination);

// First "stem (N)ext" sibling of destination that does not exist yet
std::filesystem::path uniqueDestinationPath(const std::filesystem::path& destination);
