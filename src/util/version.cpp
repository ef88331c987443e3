#include <depot/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace depot {

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

// Digits only, no leading zeros, fits in an int
static bool parse_number(const std::string& s, int& out) {
    if (s.empty() || s.size() > 9) return false;
    if (!std::all_of(s.begin(), s.end(),
            [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    if (s.size() > 1 && s[0] == '0') return false;
    out = std::stoi(s);
    return true;
}

static bool is_numeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isdigit(c); });
}

// Dot-separated identifiers of [0-9A-Za-z-]
static bool valid_identifiers(const std::string& s) {
    if (s.empty()) return false;
    std::istringstream stream(s);
    std::string ident;
    size_t count = 0;
    while (std::getline(stream, ident, '.')) {
        ++count;
        if (ident.empty()) return false;
        for (unsigned char c : ident) {
            if (!std::isalnum(c) && c != '-') return false;
        }
    }
    return count > 0 && s.back() != '.';
}

static std::vector<std::string> split_dots(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, '.')) parts.push_back(part);
    return parts;
}

// Semver precedence for pre-release tags. An empty tag (a release) sorts
// after every pre-release of the same core version.
static int compare_pre(const std::string& a, const std::string& b) {
    if (a == b) return 0;
    if (a.empty()) return 1;
    if (b.empty()) return -1;

    auto pa = split_dots(a);
    auto pb = split_dots(b);
    for (size_t i = 0; i < pa.size() && i < pb.size(); ++i) {
        bool na = is_numeric(pa[i]);
        bool nb = is_numeric(pb[i]);
        if (na && nb) {
            if (pa[i].size() != pb[i].size()) {
                return pa[i].size() < pb[i].size() ? -1 : 1;
            }
            int c = pa[i].compare(pb[i]);
            if (c != 0) return c < 0 ? -1 : 1;
        } else if (na != nb) {
            return na ? -1 : 1;
        } else {
            int c = pa[i].compare(pb[i]);
            if (c != 0) return c < 0 ? -1 : 1;
        }
    }
    if (pa.size() == pb.size()) return 0;
    return pa.size() < pb.size() ? -1 : 1;
}

// Splits "core-pre+build" into its three parts
static void split_version(const std::string& s, std::string& core,
                          std::string& pre, std::string& build,
                          bool& has_pre, bool& has_build) {
    std::string rest = s;
    has_build = false;
    has_pre = false;

    size_t plus = rest.find('+');
    if (plus != std::string::npos) {
        build = rest.substr(plus + 1);
        rest = rest.substr(0, plus);
        has_build = true;
    }

    size_t dash = rest.find('-');
    if (dash != std::string::npos) {
        pre = rest.substr(dash + 1);
        rest = rest.substr(0, dash);
        has_pre = true;
    }

    core = rest;
}

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------

Result<Version> Version::parse(const std::string& s) {
    if (s.empty()) {
        return DepotError{DepotError::Version, "empty version string"};
    }

    std::string core, pre, build;
    bool has_pre = false, has_build = false;
    split_version(s, core, pre, build, has_pre, has_build);

    auto parts = split_dots(core);
    if (parts.size() != 3 || core.back() == '.') {
        return DepotError{DepotError::Version,
            "invalid version '" + s + "'",
            "expected format: major.minor.patch[-pre][+build]"};
    }

    Version v;
    if (!parse_number(parts[0], v.major) ||
        !parse_number(parts[1], v.minor) ||
        !parse_number(parts[2], v.patch)) {
        return DepotError{DepotError::Version,
            "invalid numeric component in version '" + s + "'"};
    }

    if (has_pre) {
        if (!valid_identifiers(pre)) {
            return DepotError{DepotError::Version,
                "invalid pre-release tag in version '" + s + "'"};
        }
        v.pre = pre;
    }
    if (has_build) {
        if (!valid_identifiers(build)) {
            return DepotError{DepotError::Version,
                "invalid build metadata in version '" + s + "'"};
        }
        v.build = build;
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s = std::to_string(major) + "." +
                    std::to_string(minor) + "." +
                    std::to_string(patch);
    if (!pre.empty()) s += "-" + pre;
    if (!build.empty()) s += "+" + build;
    return s;
}

bool Version::operator==(const Version& o) const {
    return major == o.major && minor == o.minor &&
           patch == o.patch && pre == o.pre;
}

bool Version::operator!=(const Version& o) const { return !(*this == o); }

bool Version::operator<(const Version& o) const {
    if (major != o.major) return major < o.major;
    if (minor != o.minor) return minor < o.minor;
    if (patch != o.patch) return patch < o.patch;
    return compare_pre(pre, o.pre) < 0;
}

bool Version::operator<=(const Version& o) const { return !(o < *this); }
bool Version::operator>(const Version& o) const { return o < *this; }
bool Version::operator>=(const Version& o) const { return !(*this < o); }

// ---------------------------------------------------------------------------
// PartialVersion
// ---------------------------------------------------------------------------

Result<PartialVersion> PartialVersion::parse(const std::string& s) {
    if (s.empty()) {
        return DepotError{DepotError::Version, "empty partial version string"};
    }

    std::string core, pre, build;
    bool has_pre = false, has_build = false;
    split_version(s, core, pre, build, has_pre, has_build);

    auto parts = split_dots(core);
    if (parts.empty() || parts.size() > 3 || core.back() == '.') {
        return DepotError{DepotError::Version,
            "invalid partial version '" + s + "'"};
    }

    PartialVersion pv;
    if (!parse_number(parts[0], pv.major)) {
        return DepotError{DepotError::Version,
            "invalid major in partial version '" + s + "'"};
    }
    if (parts.size() > 1 && !parse_number(parts[1], pv.minor)) {
        return DepotError{DepotError::Version,
            "invalid minor in partial version '" + s + "'"};
    }
    if (parts.size() > 2 && !parse_number(parts[2], pv.patch)) {
        return DepotError{DepotError::Version,
            "invalid patch in partial version '" + s + "'"};
    }

    if (has_pre) {
        if (pv.patch < 0 || !valid_identifiers(pre)) {
            return DepotError{DepotError::Version,
                "invalid pre-release tag in '" + s + "'",
                "a pre-release tag needs a full major.minor.patch version"};
        }
        pv.pre = pre;
    }
    if (has_build && !valid_identifiers(build)) {
        return DepotError{DepotError::Version,
            "invalid build metadata in '" + s + "'"};
    }

    return Result<PartialVersion>::ok(pv);
}

std::string PartialVersion::to_string() const {
    std::string s = std::to_string(major);
    if (minor >= 0) {
        s += "." + std::to_string(minor);
        if (patch >= 0) {
            s += "." + std::to_string(patch);
        }
    }
    if (!pre.empty()) s += "-" + pre;
    return s;
}

Version PartialVersion::floor() const {
    Version v;
    v.major = major;
    v.minor = minor >= 0 ? minor : 0;
    v.patch = patch >= 0 ? patch : 0;
    v.pre = pre;
    return v;
}

// ---------------------------------------------------------------------------
// VersionConstraint
// ---------------------------------------------------------------------------

bool VersionConstraint::matches(const Version& v) const {
    // Pre-releases are only considered when the constraint asks for one
    if (v.is_prerelease() && version.pre.empty() &&
        op != ConstraintOp::NotEqual) {
        return false;
    }

    Version req = version.floor();

    switch (op) {
    case ConstraintOp::Exact:
        return v == req;

    case ConstraintOp::NotEqual:
        return v != req;

    case ConstraintOp::Pessimistic: {
        // ~>X.Y   : >=X.Y.0, <(X+1).0.0
        // ~>X.Y.Z : >=X.Y.Z, <X.(Y+1).0
        if (v < req) return false;
        if (version.patch >= 0) {
            return v.major == req.major && v.minor == req.minor;
        }
        return v.major == req.major;
    }

    case ConstraintOp::Caret:
        // ^X.Y.Z (X>0): <(X+1).0.0
        // ^0.Y.Z (Y>0): <0.(Y+1).0
        // ^0.0.Z: exact
        // ^X and ^X.Y leave the unset components free: ^0 <1.0.0, ^0.0 <0.1.0
        if (v < req) return false;
        if (req.major > 0 || version.minor < 0) {
            return v.major == req.major;
        }
        if (req.minor > 0 || version.patch < 0) {
            return v.major == 0 && v.minor == req.minor;
        }
        return v.major == 0 && v.minor == 0 && v.patch == req.patch;

    case ConstraintOp::Tilde:
        // ~X.Y[.Z]: <X.(Y+1).0, ~X: <(X+1).0.0
        if (v < req) return false;
        if (version.minor < 0) {
            return v.major == req.major;
        }
        return v.major == req.major && v.minor == req.minor;

    case ConstraintOp::GreaterEq:
        return v >= req;

    case ConstraintOp::Greater:
        return v > req;

    case ConstraintOp::LessEq:
        return v <= req;

    case ConstraintOp::Less:
        return v < req;
    }
    return false;
}

std::string VersionConstraint::to_string() const {
    const char* prefix = "";
    switch (op) {
    case ConstraintOp::Exact:       prefix = "== "; break;
    case ConstraintOp::NotEqual:    prefix = "!= "; break;
    case ConstraintOp::Pessimistic: prefix = "~> "; break;
    case ConstraintOp::Caret:       prefix = "^"; break;
    case ConstraintOp::Tilde:       prefix = "~"; break;
    case ConstraintOp::GreaterEq:   prefix = ">= "; break;
    case ConstraintOp::Greater:     prefix = "> "; break;
    case ConstraintOp::LessEq:      prefix = "<= "; break;
    case ConstraintOp::Less:        prefix = "< "; break;
    }
    return prefix + version.to_string();
}

// ---------------------------------------------------------------------------
// VersionReq
// ---------------------------------------------------------------------------

static Result<VersionConstraint> parse_single_constraint(const std::string& s) {
    size_t pos = 0;
    while (pos < s.size() && s[pos] == ' ') ++pos;

    auto starts = [&](const char* prefix) {
        return s.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
    };

    // Longest operators first; a bare version is an exact match
    ConstraintOp op = ConstraintOp::Exact;
    if (starts("~>")) {
        op = ConstraintOp::Pessimistic;
        pos += 2;
    } else if (starts("==")) {
        op = ConstraintOp::Exact;
        pos += 2;
    } else if (starts("!=")) {
        op = ConstraintOp::NotEqual;
        pos += 2;
    } else if (starts(">=")) {
        op = ConstraintOp::GreaterEq;
        pos += 2;
    } else if (starts("<=")) {
        op = ConstraintOp::LessEq;
        pos += 2;
    } else if (starts("=")) {
        op = ConstraintOp::Exact;
        ++pos;
    } else if (starts(">")) {
        op = ConstraintOp::Greater;
        ++pos;
    } else if (starts("<")) {
        op = ConstraintOp::Less;
        ++pos;
    } else if (starts("^")) {
        op = ConstraintOp::Caret;
        ++pos;
    } else if (starts("~")) {
        op = ConstraintOp::Tilde;
        ++pos;
    }

    while (pos < s.size() && s[pos] == ' ') ++pos;

    std::string ver_str = s.substr(pos);
    while (!ver_str.empty() && ver_str.back() == ' ') ver_str.pop_back();

    if (ver_str.empty()) {
        return DepotError{DepotError::Version,
            "missing version in constraint '" + s + "'"};
    }

    auto pv = PartialVersion::parse(ver_str);
    if (pv.is_err()) return std::move(pv).error();

    if (op == ConstraintOp::Pessimistic && pv.value().minor < 0) {
        return DepotError{DepotError::Version,
            "invalid constraint '" + s + "'",
            "'~>' needs at least major.minor, e.g. '~> 1.0'"};
    }

    VersionConstraint vc;
    vc.op = op;
    vc.version = pv.value();
    return Result<VersionConstraint>::ok(vc);
}

// Splits on whitespace; ',' becomes its own "and" word
static std::vector<std::string> tokenize_req(const std::string& s) {
    std::vector<std::string> words;
    std::string cur;
    auto push = [&]() {
        if (!cur.empty()) words.push_back(std::move(cur));
        cur.clear();
    };
    for (char c : s) {
        if (c == ',') {
            push();
            words.push_back("and");
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            push();
        } else {
            cur += c;
        }
    }
    push();
    return words;
}

static bool is_operator_word(const std::string& w) {
    return w == "~>" || w == "==" || w == "!=" || w == ">=" || w == "<=" ||
           w == "=" || w == ">" || w == "<" || w == "^" || w == "~";
}

Result<VersionReq> VersionReq::parse(const std::string& s) {
    auto words = tokenize_req(s);
    if (words.empty()) {
        return DepotError{DepotError::Version, "empty version requirement"};
    }

    VersionReq req;
    std::vector<VersionConstraint> clause;
    std::string pending;

    auto flush = [&]() -> Status {
        if (pending.empty() || is_operator_word(pending)) {
            return DepotError{DepotError::Version,
                "incomplete version requirement '" + s + "'"};
        }
        auto c = parse_single_constraint(pending);
        if (c.is_err()) return std::move(c).error();
        clause.push_back(std::move(c).value());
        pending.clear();
        return ok_status();
    };

    for (const auto& w : words) {
        if (w == "and") {
            DEPOT_TRY(flush());
        } else if (w == "or") {
            DEPOT_TRY(flush());
            req.alternatives.push_back(std::move(clause));
            clause.clear();
        } else if (pending.empty() || is_operator_word(pending)) {
            // An operator written apart from its version ("~> 1.0")
            pending += w;
        } else {
            return DepotError{DepotError::Version,
                "unexpected '" + w + "' in version requirement '" + s + "'",
                "join constraints with 'and', ',' or 'or'"};
        }
    }

    DEPOT_TRY(flush());
    req.alternatives.push_back(std::move(clause));

    return Result<VersionReq>::ok(std::move(req));
}

bool VersionReq::matches(const Version& v) const {
    if (alternatives.empty()) return true;
    return std::any_of(alternatives.begin(), alternatives.end(),
        [&](const std::vector<VersionConstraint>& clause) {
            return std::all_of(clause.begin(), clause.end(),
                [&](const VersionConstraint& c) { return c.matches(v); });
        });
}

std::string VersionReq::to_string() const {
    if (alternatives.empty()) return "*";
    std::string s;
    for (size_t i = 0; i < alternatives.size(); ++i) {
        if (i > 0) s += " or ";
        for (size_t j = 0; j < alternatives[i].size(); ++j) {
            if (j > 0) s += " and ";
            s += alternatives[i][j].to_string();
        }
    }
    return s;
}

} // namespace depot
