#include <aiiap/error.hpp>

namespace aiiap {

const char* AiiapError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Overlay:    return "Overlay";
        case State:      return "State";
        case NotFound:   return "NotFound";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string AiiapError::format() const {
    std::string out = "error[";
    out += code_name(code);
    out += "]: ";
    out += message;

    if (!file.empty()) {
        out += "\n  --> ";
        out += file;
        if (line > 0) {
            out += ":" + std::to_string(line);
        }
    }

    // Hints may span several lines (numbered remediation steps)
    if (!hint.empty()) {
        std::string::size_type start = 0;
        bool first = true;
        while (start <= hint.size()) {
            auto nl = hint.find('\n', start);
            std::string piece = hint.substr(start,
                nl == std::string::npos ? std::string::npos : nl - start);
            out += first ? "\n  hint: " : "\n        ";
            out += piece;
            first = false;
            if (nl == std::string::npos) break;
            start = nl + 1;
        }
    }

    return out;
}

} // namespace aiiap
