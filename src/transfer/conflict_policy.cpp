#include "transfer/conflict_policy.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <system_error>

std::string toString(ConflictPolicy policy) {
    switch (policy) {
        case ConflictPolicy::Skip:      return "skip";
        case ConflictPolicy::Overwrite: return "overwrite";
        case ConflictPolicy::Rename:    return "rename";
        case ConflictPolicy::Ask:       return "ask";
        default:                        return "unknown";
    }
}

std::string toString(ConflictDecision decision) {
    switch (decision) {
        case ConflictDecision::Skip:      return "skip";
        case ConflictDecision::Overwrite: return "overwrite";
        case ConflictDecision::Rename:    return "rename";
        default:                          return "unknown";
    }
}

std::optional<ConflictPolicy> conflictPolicyFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "skip") return ConflictPolicy::Skip;
    if (lower == "overwrite") return ConflictPolicy::Overwrite;
    if (lower == "rename") return ConflictPolicy::Rename;
    if (lower == "ask" || lower == "prompt") return ConflictPolicy::Ask;
    return std::nullopt;
}

ConflictResolver makeConflictResolver(ConflictPolicy policy, ConflictResolver askUser) {
    switch (policy) {
        case ConflictPolicy::Overwrite:
            return [](const std::filesystem::path&, const std::filesystem::path&) {
                return ConflictDecision::Overwrite;
            };
        case ConflictPolicy::Rename:
            return [](const std::filesystem::path&, const std::filesystem::path&) {
                return ConflictDecision::Rename;
            };
        case ConflictPolicy::Ask:
            if (askUser) {
                return askUser;
            }
            Logger::debug("Conflict policy 'ask' without a prompt, existing files are skipped");
            return nullptr;
        case ConflictPolicy::Skip:
        default:
            return nullptr;
    }
}

ConflictDecision resolveConflict(const ConflictResolver& resolver,
                                 const std::filesystem::path& source,
                                 const std::filesystem::path& destination) {
    if (!resolver) {
        return ConflictDecision::Skip;
    }
    return resolver(source, destination);
}

std::filesystem::path uniqueDestinationPath(const std::filesystem::path& destination) {
    const auto parent = destination.parent_path();
    const auto stem = destination.stem().string();
    const auto extension = destination.extension().string();

    for (unsigned int n = 1; n < 10000; ++n) {
        auto candidate = parent / (stem + " (" + std::to_string(n) + ")" + extension);
        std::error_code ec;
        if (!std::filesystem::exists(std::filesystem::symlink_status(candidate, ec))) {
            return candidate;
        }
    }
    throw std::runtime_error("No free name left for " + destination.string());
}
