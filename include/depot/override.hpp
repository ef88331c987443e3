#pragma once

#include <depot/result.hpp>
#include <depot/requirement.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace depot {

// Reduces a collected requirement set, grouped by PackageIdentity:
//  - identities with override requirements keep only the override; every
//    other requirement on them is dropped unchecked
//  - identities with path requirements keep only the path requirement
//  - all other requirements pass through unchanged
// The kept requirement is optional only if every requirement in its group
// was. Groups appear in first-appearance order.
//
// Fails with ConflictingOverride when overrides on one identity disagree on
// source or constraint, or when path requirements name different paths.
Result<std::vector<Requirement>> apply_overrides(
    const std::vector<Requirement>& requirements);

// Identities reached by at least one non-optional requirement
std::unordered_set<std::string> mandatory_identities(
    const std::vector<Requirement>& requirements);

} // namespace depot
