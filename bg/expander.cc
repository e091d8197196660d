#include "expander.hh"
#include <buildergen/parser_error.hh>
#include <buildergen/codegen/codegen_error.hh>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

namespace buildergen::driver {

using namespace buildergen::codegen;

namespace {

std::string location(const std::string& file, std::size_t line, std::size_t column) {
    return file + ":" + std::to_string(line) + ":" + std::to_string(column);
}

}  // namespace

Expander::Expander(const DriverOptions& options, Logger& logger)
    : options_(options)
    , logger_(logger)
{
    logger_.redirect_to_stderr(options_.to_stdout);
}

int Expander::run() {
    try {
        if (options_.output_mode == OutputMode::PrintOutputs) {
            return print_outputs();
        }

        BuilderGenerator generator = make_generator();
        std::vector<OutputFile> outputs;
        bool failed = false;

        for (const auto& input_file : options_.input_files) {
            logger_.info("Expanding: " + input_file.string());

            expansion_result result = expand_file(input_file, generator);
            if (!report_diagnostics(result.diagnostics)) {
                failed = true;
                continue;
            }

            logger_.verbose("Derived Builder for " + std::to_string(result.expanded_types.size()) + " type(s)");
            for (const auto& type_name : result.expanded_types) {
                logger_.bullet(type_name, LogLevel::Verbose);
            }

            outputs.push_back({output_path(input_file), std::move(result.text)});
        }

        if (failed) {
            return 1;
        }

        if (options_.to_stdout) {
            for (const auto& file : outputs) {
                std::cout << file.content;
            }
            std::cout.flush();
        } else {
            write_output_files(outputs);
        }

        logger_.success("Expansion successful");
        return 0;

    } catch (const parse_error& e) {
        logger_.error(location(e.file(), static_cast<std::size_t>(e.line()), static_cast<std::size_t>(e.column())) +
                      ": " + e.what());
        return 1;
    } catch (const shape_error& e) {
        logger_.error(location(e.position().file, e.position().line, e.position().column) +
                      ": " + e.what() + " ('" + e.type_name() + "')");
        return 1;
    } catch (const option_error& e) {
        logger_.error(std::string("Invalid generator option: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        logger_.error(std::string("Error: ") + e.what());
        return 1;
    }
}

// ============================================================================
// Pipeline Stages
// ============================================================================

BuilderGenerator Expander::make_generator() {
    BuilderGenerator generator;
    for (const auto& [option_name, option_value] : options_.generator_options) {
        logger_.debug("Generator option: " + option_name);
        generator.set_option(option_name, option_value);
    }
    return generator;
}

std::string Expander::read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

expansion_result Expander::expand_file(const std::filesystem::path& path, const BuilderGenerator& generator) {
    logger_.verbose("Parsing: " + path.string());
    std::string text = read_file(path);
    return expand_source(text, path.string(), generator);
}

bool Expander::report_diagnostics(const std::vector<diagnostic>& diagnostics) {
    std::size_t errors = 0;
    std::size_t warnings = 0;

    for (diagnostic diag : diagnostics) {
        if (diag.level == diagnostic_level::warning) {
            if (options_.suppress_all_warnings || options_.disabled_warnings.count(diag.code) > 0) {
                continue;
            }
            if (options_.warnings_as_errors) {
                diag.level = diagnostic_level::error;
            }
        }
        logger_.report(diag);
        if (diag.level == diagnostic_level::error) {
            errors++;
        } else {
            warnings++;
        }
    }

    if (errors > 0) {
        logger_.error("Total errors: " + std::to_string(errors));
    }
    if (warnings > 0) {
        logger_.warning("Total warnings: " + std::to_string(warnings));
    }
    return errors == 0;
}

// ============================================================================
// Output
// ============================================================================

std::filesystem::path Expander::output_path(const std::filesystem::path& input) const {
    std::filesystem::path output_dir = options_.output_dir;
    if (output_dir.empty()) {
        output_dir = std::filesystem::current_path();
    }
    return output_dir / (input.stem().string() + ".expanded.rs");
}

void Expander::write_output_files(const std::vector<OutputFile>& files) {
    for (const auto& file : files) {
        logger_.verbose("Writing: " + file.path.string());

        auto parent = file.path.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent);
        }

        std::ofstream ofs(file.path);
        if (!ofs) {
            throw std::runtime_error("Failed to open file for writing: " + file.path.string());
        }

        ofs << file.content;

        if (!ofs) {
            throw std::runtime_error("Failed to write file: " + file.path.string());
        }

        logger_.success("Generated: " + file.path.string());
    }
}

int Expander::print_outputs() {
    for (const auto& input_file : options_.input_files) {
        std::filesystem::path path = options_.output_dir / (input_file.stem().string() + ".expanded.rs");
        std::cout << path.string() << "\n";
    }
    return 0;
}

}  // namespace buildergen::driver
