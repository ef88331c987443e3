#include <depot/error.hpp>

namespace depot {

const char* DepotError::code_name(Code c) {
    switch (c) {
        case IO:                  return "IO";
        case Parse:               return "Parse";
        case Version:             return "Version";
        case Config:              return "Config";
        case InvalidArg:          return "InvalidArg";
        case InvalidDeclaration:  return "InvalidDeclaration";
        case ConflictingOverride: return "ConflictingOverride";
        case Unsatisfiable:       return "Unsatisfiable";
        case NameConflict:        return "NameConflict";
        case PathNotFound:        return "PathNotFound";
        case InvalidManifest:     return "InvalidManifest";
        case NotFound:            return "NotFound";
        case Network:             return "Network";
        case MalformedMetadata:   return "MalformedMetadata";
        case Cycle:               return "Cycle";
        case Cancelled:           return "Cancelled";
    }
    return "Unknown";
}

std::string DepotError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    for (const auto& chain : requestors) {
        result += "\n  required by: ";
        result += chain;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace depot
