#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace buildergen::codegen {

/// Option type enum
enum class OptionType {
    Bool,      // true/false, on/off, yes/no, 1/0
    String,    // Arbitrary string value
    Choice     // One of predefined choices
};

/// Description of a generator option (`--builder-<name>=<value>` on the command line)
struct OptionDescription {
    std::string name;                          // "copy-attributes", "value-param", ...
    OptionType type;
    std::string description;                   // Help text
    std::optional<std::string> default_value;  // Default if not specified
    std::vector<std::string> choices;          // For OptionType::Choice

    /// Check if this option is required (no default value)
    bool is_required() const {
        return !default_value.has_value();
    }
};

/// Type-safe variant for option values
using OptionValue = std::variant<bool, std::string>;

/// Converts command-line text to a value of the described type.
/// @throws option_error if the text is not valid for the option
OptionValue parse_option_value(const OptionDescription& option, const std::string& text);

/// Output file descriptor
struct OutputFile {
    std::filesystem::path path;  // Full path: output_dir + filename
    std::string content;         // Expanded source text
};

}  // namespace buildergen::codegen
