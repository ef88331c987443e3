#include <depot/report.hpp>
#include <algorithm>

namespace depot {

std::vector<ReportEntry> build_report(const Resolution& resolution,
                                      const LockFile& previous) {
    std::vector<ReportEntry> out;
    out.reserve(resolution.packages.size());

    for (const auto& pkg : resolution.packages) {
        ReportEntry entry;
        entry.name = pkg.name;
        entry.app = pkg.app;
        entry.registry_name = pkg.registry_name;
        entry.version = pkg.version.to_string();
        entry.source_kind = pkg.source.is_path() ? "path" : "registry";
        entry.path = pkg.source.path;

        if (const LockEntry* old = previous.find(pkg.name)) {
            entry.locked_version = old->version;
            entry.locked = old->version == entry.version &&
                           old->source == pkg.source.to_string();
        }
        out.push_back(std::move(entry));
    }

    std::sort(out.begin(), out.end(),
              [](const ReportEntry& a, const ReportEntry& b) { return a.name < b.name; });
    return out;
}

} // namespace depot
