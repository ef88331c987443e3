#pragma once

#include <depot/result.hpp>
#include <string>

namespace depot {

// Package name: [a-zA-Z][a-zA-Z0-9_-]*
// The normalized form (lowercase, '-' -> '_') is the PackageIdentity that
// unifies every requirement for the same dependency.
class PkgName {
public:
    static Result<PkgName> parse(const std::string& raw);

    const std::string& raw() const { return raw_; }
    const std::string& identity() const { return identity_; }

    bool operator==(const PkgName& o) const { return identity_ == o.identity_; }
    bool operator!=(const PkgName& o) const { return !(*this == o); }

private:
    std::string raw_;
    std::string identity_;
};

// Identity of a raw name, or the error parse() would give
Result<std::string> package_identity(const std::string& raw);

} // namespace depot
