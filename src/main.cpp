// src/main.cpp - Sunward entry point
//
// Prints the apparent position of the Sun for a date and a location:
//  1. Parse command-line options
//  2. Bring up logging
//  3. Prompt for anything not given on the command line
//  4. Compute and print azimuth/altitude

#include "app/application.hpp"
#include "app/cli_options.hpp"
#include "core/logger.hpp"

#include <iostream>
#include <utility>

using namespace sunward;

int main(int argc, char** argv) {
    app::CliOptions options = app::parse_cli_options(argc, argv);

    if (options.show_help) {
        std::cout << app::usage_text(argv[0]);
        return 0;
    }

    core::Logger::init(options.logger);
    SWD_CORE_DEBUG("Sunward starting");

    const bool usage_error = options.had_parse_error;
    app::Application application(std::move(options), std::cin, std::cout);
    const app::ExitCode code = application.run();

    if (usage_error) {
        std::cerr << app::usage_text(argv[0]);
    }

    SWD_CORE_DEBUG("Sunward finished with exit code {}", static_cast<int>(code));
    core::Logger::shutdown();
    return static_cast<int>(code);
}
