#pragma once

#include "driver_options.hh"
#include "logger.hh"
#include <buildergen/diagnostics.hh>
#include <buildergen/expand.hh>
#include <buildergen/codegen/builder_generator.hh>
#include <buildergen/codegen/option_description.hh>

namespace buildergen::driver {

/// Expands every input file and writes `<stem>.expanded.rs`
class Expander {
public:
    explicit Expander(const DriverOptions& options, Logger& logger);

    /// Returns 0 on success, non-zero on error
    int run();

private:
    // ========================================================================
    // Pipeline Stages
    // ========================================================================

    /// Generator with the command-line options applied
    codegen::BuilderGenerator make_generator();

    std::string read_file(const std::filesystem::path& path);

    /// Parse and expand one file; throws on parse and shape errors
    expansion_result expand_file(const std::filesystem::path& path, const codegen::BuilderGenerator& generator);

    /// Returns false when a diagnostic counts as an error
    bool report_diagnostics(const std::vector<diagnostic>& diagnostics);

    // ========================================================================
    // Output
    // ========================================================================

    std::filesystem::path output_path(const std::filesystem::path& input) const;
    void write_output_files(const std::vector<codegen::OutputFile>& files);

    /// For --print-outputs
    int print_outputs();

    const DriverOptions& options_;
    Logger& logger_;
};

}  // namespace buildergen::driver
