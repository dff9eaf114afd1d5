#include <weft/error.hpp>

namespace weft {

const char* WeftError::code_name(Code c) {
    switch (c) {
        case IO:                         return "IO";
        case Parse:                      return "Parse";
        case Config:                     return "Config";
        case InvalidArg:                 return "InvalidArg";
        case NotFound:                   return "NotFound";
        case Duplicate:                  return "Duplicate";
        case MalformedClassFormat:       return "MalformedClassFormat";
        case LockTimeout:                return "LockTimeout";
        case CacheInitializationFailure: return "CacheInitializationFailure";
        case StaleOrUncleanCache:        return "StaleOrUncleanCache";
        case HashCollisionDetected:      return "HashCollisionDetected";
    }
    return "Unknown";
}

std::string WeftError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
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

} // namespace weft
