#include "driver_options.hh"
#include <buildergen/codegen/builder_generator.hh>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace buildergen::driver {

using namespace buildergen::codegen;

// ============================================================================
// Helper Functions
// ============================================================================

static bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

static std::string get_option_value(const char* arg, const char* prefix) {
    return arg + std::strlen(prefix);
}

// Parse generator option: --builder-copy-attributes=false
// Returns (option_name, parsed_value), or nothing when the prefix is not ours
static std::optional<std::pair<std::string, OptionValue>> parse_generator_option(const char* arg) {
    std::string_view sv(arg + 2);  // Skip "--"
    std::string prefix = std::string(GENERATOR_OPTION_PREFIX) + "-";

    if (sv.substr(0, prefix.size()) != prefix) {
        return std::nullopt;
    }

    std::string_view rest = sv.substr(prefix.size());
    size_t eq_pos = rest.find('=');
    if (eq_pos == std::string_view::npos) {
        throw std::runtime_error(
            "Generator option requires value: --" + prefix + "<option>=<value>"
        );
    }

    std::string option_name(rest.substr(0, eq_pos));
    std::string value_str(rest.substr(eq_pos + 1));

    auto options = BuilderGenerator::get_options();
    auto opt_it = std::find_if(options.begin(), options.end(),
        [&](const OptionDescription& opt) { return opt.name == option_name; });

    if (opt_it == options.end()) {
        throw std::runtime_error("Unknown generator option: " + option_name);
    }

    return std::make_pair(option_name, parse_option_value(*opt_it, value_str));
}

static ColorMode parse_color_mode(const std::string& value) {
    if (value == "auto") return ColorMode::Auto;
    if (value == "always") return ColorMode::Always;
    if (value == "never") return ColorMode::Never;
    throw std::runtime_error("Invalid color mode: " + value + " (expected: auto, always, never)");
}

// ============================================================================
// Main Parser
// ============================================================================

DriverOptions parse_command_line(int argc, char** argv) {
    DriverOptions opts;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        // Help options
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            print_help(argv[0]);
            std::exit(0);
        }

        if (std::strcmp(arg, "--version") == 0) {
            print_version();
            std::exit(0);
        }

        if (std::strcmp(arg, "--list-options") == 0) {
            print_options();
            std::exit(0);
        }

        // Verbosity
        if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
            opts.verbose = true;
            continue;
        }

        if (std::strcmp(arg, "-q") == 0 || std::strcmp(arg, "--quiet") == 0) {
            opts.quiet = true;
            continue;
        }

        if (starts_with(arg, "--color=")) {
            opts.color = parse_color_mode(get_option_value(arg, "--color="));
            continue;
        }

        // Output
        if (std::strcmp(arg, "--stdout") == 0) {
            opts.to_stdout = true;
            continue;
        }

        if (std::strcmp(arg, "--print-outputs") == 0) {
            opts.output_mode = OutputMode::PrintOutputs;
            continue;
        }

        if (starts_with(arg, "-o")) {
            std::string value = get_option_value(arg, "-o");
            if (value.empty() && i + 1 < argc) {
                value = argv[++i];
            }
            if (value.empty()) {
                throw std::runtime_error("Option -o requires argument");
            }
            opts.output_dir = value;
            continue;
        }

        // Warning options
        if (std::strcmp(arg, "-Werror") == 0) {
            opts.warnings_as_errors = true;
            continue;
        }

        if (std::strcmp(arg, "-w") == 0) {
            opts.suppress_all_warnings = true;
            continue;
        }

        if (starts_with(arg, "-Wno-")) {
            opts.disabled_warnings.insert(get_option_value(arg, "-Wno-"));
            continue;
        }

        // Generator options (--builder-setter-visibility=pub(crate))
        if (starts_with(arg, "--")) {
            auto result = parse_generator_option(arg);
            if (result) {
                opts.generator_options[result->first] = result->second;
                continue;
            }
        }

        // Unknown option starting with dash
        if (arg[0] == '-') {
            throw std::runtime_error(std::string("Unknown option: ") + arg);
        }

        // Input file
        opts.input_files.push_back(arg);
    }

    // Validation
    if (opts.input_files.empty()) {
        throw std::runtime_error("No input files specified");
    }

    if (opts.quiet && opts.verbose) {
        throw std::runtime_error("Cannot specify both -q/--quiet and -v/--verbose");
    }

    if (opts.to_stdout && !opts.output_dir.empty()) {
        throw std::runtime_error("Cannot specify both -o and --stdout");
    }

    return opts;
}

// ============================================================================
// Help and Info Functions
// ============================================================================

void print_help(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <input.rs>...\n\n";

    std::cout << "Expands #[derive(Builder)] on Rust structs into impl blocks of chained setters.\n\n";

    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  --version               Show version information\n";
    std::cout << "  --list-options          List generator options\n";
    std::cout << "\n";

    std::cout << "Output:\n";
    std::cout << "  -o <dir>                Output directory (default: current directory)\n";
    std::cout << "  --stdout                Write expanded source to standard output\n";
    std::cout << "  --print-outputs         Print output filenames and exit\n";
    std::cout << "\n";

    std::cout << "Diagnostics:\n";
    std::cout << "  -v, --verbose           Verbose output\n";
    std::cout << "  -q, --quiet             Quiet mode (errors only)\n";
    std::cout << "  --color=<mode>          Colored output: auto, always, never\n";
    std::cout << "  -w                      Suppress all warnings\n";
    std::cout << "  -Werror                 Treat all warnings as errors\n";
    std::cout << "  -Wno-<code>             Disable specific warning\n";
    std::cout << "\n";

    std::cout << "Generator Options:\n";
    std::cout << "  --" << GENERATOR_OPTION_PREFIX << "-<option>=<value>  Set generator option\n";
    std::cout << "\n";
    std::cout << "  Use --list-options to see available options.\n";
    std::cout << "\n";

    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " config.rs\n";
    std::cout << "  " << program_name << " -o generated config.rs\n";
    std::cout << "  " << program_name << " --builder-setter-visibility=pub(crate) --stdout config.rs\n";
}

void print_version() {
    std::cout << "buildergen v0.1.0\n";
    std::cout << "Build: " << __DATE__ << " " << __TIME__ << "\n";
}

void print_options() {
    std::cout << "Generator options:\n\n";

    for (const auto& opt : BuilderGenerator::get_options()) {
        std::cout << "  --" << GENERATOR_OPTION_PREFIX << "-" << opt.name << "=<value>\n";
        std::cout << "    " << opt.description << "\n";
        if (!opt.choices.empty()) {
            std::cout << "    Choices:";
            for (const auto& choice : opt.choices) {
                std::cout << " " << choice;
            }
            std::cout << "\n";
        }
        if (opt.default_value) {
            std::cout << "    Default: " << *opt.default_value << "\n";
        }
        std::cout << "\n";
    }
}

}  // namespace buildergen::driver
