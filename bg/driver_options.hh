#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include <buildergen/codegen/option_description.hh>

#include "logger.hh"

namespace buildergen::driver {

/// Output mode for the expander
enum class OutputMode {
    Expand,        // Normal expansion (default)
    PrintOutputs   // Print output filenames and exit (for build system dependency tracking)
};

/// Driver options
struct DriverOptions {
    // ========================================================================
    // Input/Output
    // ========================================================================

    std::vector<std::filesystem::path> input_files;
    std::filesystem::path output_dir;                // Always a directory
    bool to_stdout = false;                          // --stdout

    // ========================================================================
    // Generator Options
    // ========================================================================

    /// Parsed from CLI args like --builder-copy-attributes=false,
    /// applied to the generator before expansion
    std::map<std::string, codegen::OptionValue> generator_options;

    // ========================================================================
    // Warnings
    // ========================================================================

    bool warnings_as_errors = false;                 // -Werror
    bool suppress_all_warnings = false;              // -w
    std::set<std::string> disabled_warnings;         // -Wno-W001

    // ========================================================================
    // Diagnostic Options
    // ========================================================================

    bool verbose = false;                            // -v, --verbose
    bool quiet = false;                              // -q, --quiet
    ColorMode color = ColorMode::Auto;               // --color=auto|always|never

    OutputMode output_mode = OutputMode::Expand;     // --print-outputs
};

/// Prefix of generator options on the command line
constexpr const char* GENERATOR_OPTION_PREFIX = "builder";

/// Parse command-line arguments
/// Throws std::runtime_error on invalid arguments
DriverOptions parse_command_line(int argc, char** argv);

/// Print help message
void print_help(const char* program_name);

/// Print version information
void print_version();

/// Print generator options with their defaults
void print_options();

}  // namespace buildergen::driver
