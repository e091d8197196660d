//
// Non-fatal findings of the builder generator
//

#pragma once

#include <string>

#include "tokens.hh"

namespace buildergen {

/// Severity level for diagnostic messages.
enum class diagnostic_level {
    error,      ///< A warning promoted by -Werror
    warning     ///< Output is produced but may not be what was intended
};

/// Diagnostic codes, usable with the driver's -w/-Werror switches.
namespace diag_codes {
    constexpr const char* W_VALUE_PARAM_RENAMED = "W001";  ///< Setter type parameter collides with a struct generic
    constexpr const char* W_EMPTY_STRUCT = "W002";         ///< Struct has no fields, the impl block is empty
}

/// A single diagnostic message.
///
/// Example diagnostic output:
///   config.rs:3:12: warning: generic parameter 'VALUE' already declared, setters use 'VALUE0' [W001]
struct diagnostic {
    diagnostic_level level;
    std::string code;
    std::string message;
    ast::source_pos position;

    /// Format as `file:line:column: level: message [code]`
    std::string format() const;
};

}  // namespace buildergen
