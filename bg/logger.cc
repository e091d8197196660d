#include "logger.hh"
#include <termcolor/termcolor.hpp>

namespace buildergen::driver {

Logger::Logger(LogLevel level, ColorMode color)
    : level_(level)
    , color_mode_(color)
{
    switch (color_mode_) {
        case ColorMode::Always:
            std::cout << termcolor::colorize;
            std::cerr << termcolor::colorize;
            break;
        case ColorMode::Never:
            std::cout << termcolor::nocolorize;
            std::cerr << termcolor::nocolorize;
            break;
        case ColorMode::Auto:
            // termcolor checks isatty on its own
            break;
    }
}

bool Logger::should_log(LogLevel required_level) const {
    return static_cast<int>(level_) >= static_cast<int>(required_level);
}

void Logger::error(const std::string& message) {
    if (!should_log(LogLevel::Quiet)) return;

    std::cerr << termcolor::bold << termcolor::red
              << "error: " << termcolor::reset
              << message << "\n";
}

void Logger::warning(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    std::cerr << termcolor::bold << termcolor::yellow
              << "warning: " << termcolor::reset
              << message << "\n";
}

void Logger::info(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    out() << message << "\n";
}

void Logger::success(const std::string& message) {
    if (!should_log(LogLevel::Normal)) return;

    out() << termcolor::bold << termcolor::green
          << "✓ " << termcolor::reset
          << message << "\n";
}

void Logger::verbose(const std::string& message) {
    if (!should_log(LogLevel::Verbose)) return;

    out() << termcolor::cyan
          << message << termcolor::reset << "\n";
}

void Logger::debug(const std::string& message) {
    if (!should_log(LogLevel::Debug)) return;

    out() << termcolor::magenta
          << "[debug] " << termcolor::reset
          << message << "\n";
}

void Logger::report(const diagnostic& diag) {
    std::string text = diag.position.file + ":" + std::to_string(diag.position.line) + ":" +
                       std::to_string(diag.position.column) + ": " + diag.message;
    if (!diag.code.empty()) {
        text += " [" + diag.code + "]";
    }

    if (diag.level == diagnostic_level::error) {
        error(text);
    } else {
        warning(text);
    }
}

void Logger::bullet(const std::string& message, LogLevel min_level) {
    if (!should_log(min_level)) return;

    out() << "  • " << message << "\n";
}

} // namespace buildergen::driver
