#pragma once

#include <string>
#include <vector>

namespace depot {

struct DepotError {
    enum Code {
        IO,
        Parse,
        Version,
        Config,
        InvalidArg,
        InvalidDeclaration,
        ConflictingOverride,
        Unsatisfiable,
        NameConflict,
        PathNotFound,
        InvalidManifest,
        NotFound,
        Network,
        MalformedMetadata,
        Cycle,
        Cancelled
    };

    Code code = IO;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // One entry per requirement chain behind a resolution failure,
    // e.g. "root -> ecto 0.2.0 -> postgrex 0.2.1 requires ex_doc ~> 0.1.0"
    std::vector<std::string> requestors;

    DepotError() = default;
    DepotError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    DepotError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    DepotError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    DepotError& with_requestors(std::vector<std::string> chains) {
        requestors = std::move(chains);
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace depot
