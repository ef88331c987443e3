#include <depot/name.hpp>
#include <algorithm>
#include <cctype>

namespace depot {

Result<PkgName> PkgName::parse(const std::string& raw) {
    if (raw.empty()) {
        return DepotError{DepotError::InvalidArg, "empty package name"};
    }

    if (!std::isalpha(static_cast<unsigned char>(raw[0]))) {
        return DepotError{DepotError::InvalidArg,
            "invalid package name '" + raw + "'",
            "package names must start with a letter"};
    }

    auto bad = std::find_if(raw.begin() + 1, raw.end(), [](char c) {
        return !std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-';
    });
    if (bad != raw.end()) {
        return DepotError{DepotError::InvalidArg,
            "invalid character '" + std::string(1, *bad) +
            "' in package name '" + raw + "'",
            "allowed: [a-zA-Z0-9_-]"};
    }

    PkgName name;
    name.raw_ = raw;
    name.identity_ = raw;
    std::transform(name.identity_.begin(), name.identity_.end(),
                   name.identity_.begin(),
                   [](char c) -> char {
                       if (c == '-') return '_';
                       return static_cast<char>(
                           std::tolower(static_cast<unsigned char>(c)));
                   });

    return Result<PkgName>::ok(std::move(name));
}

Result<std::string> package_identity(const std::string& raw) {
    auto name = PkgName::parse(raw);
    if (name.is_err()) return std::move(name).error();
    return Result<std::string>::ok(name.value().identity());
}

} // namespace depot
