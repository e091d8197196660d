#include <iostream>
#include <string>

#include "driver_options.hh"
#include "expander.hh"
#include "logger.hh"

int main(int argc, char* argv[]) {
    using namespace buildergen::driver;

    try {
        // Handles --help, --version and --list-options itself
        DriverOptions opts = parse_command_line(argc, argv);

        LogLevel log_level = LogLevel::Normal;
        if (opts.quiet) log_level = LogLevel::Quiet;
        if (opts.verbose) log_level = LogLevel::Verbose;

        Logger logger(log_level, opts.color);

        Expander expander(opts, logger);
        return expander.run();

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
