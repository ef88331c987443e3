#pragma once

#include <depot/result.hpp>
#include <depot/requirement.hpp>
#include <depot/version.hpp>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace depot {

// One published release as the registry describes it
struct Release {
    std::string name;
    Version version;
    std::string checksum;
    std::vector<RawRequirement> requirements;
};

// Package metadata lookup. Failures: NotFound (the package or release does
// not exist), Network (could not determine; retried by the caller's layer,
// never by the resolver), MalformedMetadata.
// Repeated calls with the same arguments must give the same answer.
class Registry {
public:
    virtual ~Registry() = default;

    virtual Result<std::vector<Version>> versions(const std::string& name) = 0;

    virtual Result<std::vector<RawRequirement>> requirements(
        const std::string& name, const Version& version) = 0;

    virtual Result<std::string> checksum(const std::string& name,
                                         const Version& version) = 0;
};

// Memoizes successful lookups and NotFound answers of another registry.
// Meant to live for one resolution run.
class CachingRegistry : public Registry {
public:
    explicit CachingRegistry(Registry& inner) : inner_(inner) {}

    Result<std::vector<Version>> versions(const std::string& name) override;
    Result<std::vector<RawRequirement>> requirements(
        const std::string& name, const Version& version) override;
    Result<std::string> checksum(const std::string& name,
                                 const Version& version) override;

    // Calls forwarded to the wrapped registry
    size_t inner_calls() const { return inner_calls_; }

private:
    Registry& inner_;
    std::unordered_map<std::string, std::vector<Version>> versions_;
    std::unordered_set<std::string> missing_;
    std::unordered_map<std::string, std::vector<RawRequirement>> requirements_;
    std::unordered_map<std::string, std::string> checksums_;
    size_t inner_calls_ = 0;
};

} // namespace depot
