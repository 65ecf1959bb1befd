#include <drift/error.hpp>

#include <sstream>

namespace drift {

namespace {

const char* const kCodeNames[] = {
    "IO", "Parse", "Schema", "Config", "NotFound", "Duplicate", "InvalidArg",
};

} // namespace

const char* DriftError::code_name(Code c) {
    auto idx = static_cast<size_t>(c);
    if (idx >= sizeof(kCodeNames) / sizeof(kCodeNames[0])) return "Unknown";
    return kCodeNames[idx];
}

DriftError& DriftError::at(std::string f, int l) {
    file = std::move(f);
    line = l;
    return *this;
}

// error[Parse]: cannot parse repo-state.json: ...
//   --> common/config/drift/repo-state.json:3
//   hint: restore it from version control
std::string DriftError::format() const {
    std::ostringstream os;
    os << "error[" << code_name(code) << "]: " << message;
    if (!file.empty()) {
        os << "\n  --> " << file;
        if (line > 0) os << ':' << line;
    }
    if (!hint.empty()) {
        os << "\n  hint: " << hint;
    }
    return os.str();
}

} // namespace drift
