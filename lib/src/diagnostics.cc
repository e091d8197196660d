//
// Diagnostic formatting
//

#include <buildergen/diagnostics.hh>

#include <sstream>

namespace buildergen {

std::string diagnostic::format() const {
    std::ostringstream oss;

    oss << position.file << ":"
        << position.line << ":"
        << position.column << ": ";

    switch (level) {
        case diagnostic_level::error:
            oss << "error: ";
            break;
        case diagnostic_level::warning:
            oss << "warning: ";
            break;
    }

    oss << message;

    if (!code.empty()) {
        oss << " [" << code << "]";
    }

    return oss.str();
}

}  // namespace buildergen
