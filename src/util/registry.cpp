#include <depot/registry.hpp>

namespace depot {

static std::string release_key(const std::string& name, const Version& version) {
    return name + "@" + version.to_string();
}

Result<std::vector<Version>> CachingRegistry::versions(const std::string& name) {
    auto it = versions_.find(name);
    if (it != versions_.end()) {
        return Result<std::vector<Version>>::ok(it->second);
    }
    if (missing_.count(name)) {
        return DepotError{DepotError::NotFound,
            "no package named '" + name + "' in registry"};
    }

    ++inner_calls_;
    auto r = inner_.versions(name);
    if (r.is_ok()) {
        versions_[name] = r.value();
    } else if (r.failed_with(DepotError::NotFound)) {
        missing_.insert(name);
    }
    return r;
}

Result<std::vector<RawRequirement>> CachingRegistry::requirements(
    const std::string& name, const Version& version)
{
    std::string key = release_key(name, version);
    auto it = requirements_.find(key);
    if (it != requirements_.end()) {
        return Result<std::vector<RawRequirement>>::ok(it->second);
    }

    ++inner_calls_;
    auto r = inner_.requirements(name, version);
    if (r.is_ok()) requirements_[key] = r.value();
    return r;
}

Result<std::string> CachingRegistry::checksum(const std::string& name,
                                              const Version& version) {
    std::string key = release_key(name, version);
    auto it = checksums_.find(key);
    if (it != checksums_.end()) {
        return Result<std::string>::ok(it->second);
    }

    ++inner_calls_;
    auto r = inner_.checksum(name, version);
    if (r.is_ok()) checksums_[key] = r.value();
    return r;
}

} // namespace depot
