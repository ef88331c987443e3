#include <depot/override.hpp>
#include <unordered_map>

namespace depot {

// "ex_doc ~> 0.1.0 (from root)"
static std::string describe_with_origin(const Requirement& req) {
    return req.describe() + " (from " + req.requestor + ")";
}

static Result<Requirement> reduce_overrides(const std::vector<const Requirement*>& group) {
    const Requirement* first = nullptr;
    bool all_optional = true;

    for (const auto* req : group) {
        all_optional = all_optional && req->optional;
        if (!req->override) continue;
        if (!first) {
            first = req;
            continue;
        }
        if (req->source != first->source ||
            req->constraint_text != first->constraint_text) {
            return DepotError(DepotError::ConflictingOverride,
                "conflicting overrides for '" + first->package + "': " +
                describe_with_origin(*first) + " and " + describe_with_origin(*req),
                "declare the override once, or make both declarations identical");
        }
    }

    Requirement kept = *first;
    kept.optional = all_optional;
    return Result<Requirement>::ok(std::move(kept));
}

static Result<Requirement> reduce_paths(const std::vector<const Requirement*>& group) {
    const Requirement* first = nullptr;
    bool all_optional = true;

    for (const auto* req : group) {
        all_optional = all_optional && req->optional;
        if (!req->is_path()) continue;
        if (!first) {
            first = req;
            continue;
        }
        if (req->source.path != first->source.path) {
            return DepotError(DepotError::ConflictingOverride,
                "'" + first->package + "' is required from two paths: " +
                describe_with_origin(*first) + " and " + describe_with_origin(*req),
                "add an override to pick one of them");
        }
    }

    Requirement kept = *first;
    kept.optional = all_optional;
    return Result<Requirement>::ok(std::move(kept));
}

Result<std::vector<Requirement>> apply_overrides(
    const std::vector<Requirement>& requirements)
{
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<const Requirement*>> groups;

    for (const auto& req : requirements) {
        auto& group = groups[req.package];
        if (group.empty()) order.push_back(req.package);
        group.push_back(&req);
    }

    std::vector<Requirement> out;
    out.reserve(requirements.size());

    for (const auto& identity : order) {
        const auto& group = groups[identity];

        bool has_override = false;
        bool has_path = false;
        for (const auto* req : group) {
            has_override = has_override || req->override;
            has_path = has_path || req->is_path();
        }

        if (has_override) {
            auto kept = reduce_overrides(group);
            if (kept.is_err()) return std::move(kept).error();
            out.push_back(std::move(kept).value());
        } else if (has_path) {
            auto kept = reduce_paths(group);
            if (kept.is_err()) return std::move(kept).error();
            out.push_back(std::move(kept).value());
        } else {
            for (const auto* req : group) out.push_back(*req);
        }
    }

    return Result<std::vector<Requirement>>::ok(std::move(out));
}

std::unordered_set<std::string> mandatory_identities(
    const std::vector<Requirement>& requirements)
{
    std::unordered_set<std::string> out;
    for (const auto& req : requirements) {
        if (!req.optional) out.insert(req.package);
    }
    return out;
}

} // namespace depot
