#pragma once

#include <iostream>
#include <string>

#include <buildergen/diagnostics.hh>

namespace buildergen::driver {

enum class LogLevel {
    Quiet,   // Errors only
    Normal,  // Errors, warnings, info, success
    Verbose, // + per-type and per-file details
    Debug    // + debug messages
};

enum class ColorMode {
    Auto,    // Auto-detect TTY
    Always,  // Force colors
    Never    // Disable colors
};

/**
 * Console logger for the expander, colored with termcolor.
 *
 * Output routing:
 * - Errors, warnings → stderr
 * - Info, success, verbose, debug → stdout (stderr when the
 *   expansion itself is written to stdout)
 */
class Logger {
public:
    explicit Logger(LogLevel level = LogLevel::Normal,
                   ColorMode color = ColorMode::Auto);

    void error(const std::string& message);
    void warning(const std::string& message);
    void info(const std::string& message);
    void success(const std::string& message);
    void verbose(const std::string& message);
    void debug(const std::string& message);

    /// `file:line:column: message [code]` at the diagnostic's level
    void report(const diagnostic& diag);

    void bullet(const std::string& message, LogLevel min_level = LogLevel::Normal);

    /// Keep stdout clean for expanded source
    void redirect_to_stderr(bool enabled) { redirect_ = enabled; }

    void set_level(LogLevel level) { level_ = level; }
    LogLevel get_level() const { return level_; }

private:
    LogLevel level_;
    ColorMode color_mode_;
    bool redirect_ = false;

    bool should_log(LogLevel required_level) const;
    std::ostream& out() const { return redirect_ ? std::cerr : std::cout; }
};

} // namespace buildergen::driver
