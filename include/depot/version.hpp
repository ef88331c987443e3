#pragma once

#include <depot/result.hpp>
#include <string>
#include <vector>

namespace depot {

// Release version: major.minor.patch[-pre][+build]
struct Version {
    int major = 0;
    int minor = 0;
    int patch = 0;
    std::string pre;    // e.g. "rc.1", empty for a release
    std::string build;  // build metadata, ignored for precedence

    static Result<Version> parse(const std::string& s);
    std::string to_string() const;

    bool is_prerelease() const { return !pre.empty(); }

    bool operator==(const Version& o) const;
    bool operator!=(const Version& o) const;
    bool operator<(const Version& o) const;
    bool operator<=(const Version& o) const;
    bool operator>(const Version& o) const;
    bool operator>=(const Version& o) const;
};

// Version as written in a constraint: "1", "1.2", "1.2.3", "1.2.3-rc.1"
struct PartialVersion {
    int major = 0;
    int minor = -1;  // -1 means unset
    int patch = -1;  // -1 means unset
    std::string pre;

    static Result<PartialVersion> parse(const std::string& s);
    std::string to_string() const;

    // Unset components read as zero
    Version floor() const;
};

enum class ConstraintOp {
    Exact,        // 1.2.3, ==1.2.3, =1.2.3
    NotEqual,     // !=1.2.3
    Pessimistic,  // ~>1.2 (>=1.2.0 <2.0.0), ~>1.2.3 (>=1.2.3 <1.3.0)
    Caret,        // ^1.2.3 (compatible with)
    Tilde,        // ~1.2.3 (patch-level changes)
    GreaterEq,
    Greater,
    LessEq,
    Less,
};

struct VersionConstraint {
    ConstraintOp op = ConstraintOp::Exact;
    PartialVersion version;

    bool matches(const Version& v) const;
    std::string to_string() const;
};

// ">= 1.0.0 and < 2.0.0 or == 3.0.0-rc.1"; ',' is accepted for 'and'.
struct VersionReq {
    // Disjunction of conjunctions. No alternatives means any version.
    std::vector<std::vector<VersionConstraint>> alternatives;

    static VersionReq any() { return VersionReq{}; }
    static Result<VersionReq> parse(const std::string& s);

    bool is_any() const { return alternatives.empty(); }
    bool matches(const Version& v) const;
    std::string to_string() const;
};

} // namespace depot
