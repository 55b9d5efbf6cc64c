/// @file cli_options.cpp
/// @brief argv parsing for the sunward executable.

#include "app/cli_options.hpp"

#include <cstring>
#include <utility>

namespace sunward::app
{

namespace
{

bool matches(const char* arg, const char* full, const char* alias = nullptr)
{
    return std::strcmp(arg, full) == 0 || (alias != nullptr && std::strcmp(arg, alias) == 0);
}

void set_error(CliOptions& options, std::string message)
{
    // Keep the first error; later ones are usually consequences
    if (!options.had_parse_error)
    {
        options.had_parse_error = true;
        options.error_message = std::move(message);
    }
}

} // anonymous namespace

CliOptions parse_cli_options(int argc, const char* const* argv)
{
    CliOptions options;

    for (int i = 1; i < argc; ++i)
    {
        const char* arg = argv[i];
        const bool has_value = i + 1 < argc;

        // Options that take a value
        std::optional<std::string>* target = nullptr;
        if (matches(arg, "--date", "-d"))
        {
            target = &options.date;
        }
        else if (matches(arg, "--lat", "--latitude"))
        {
            target = &options.latitude;
        }
        else if (matches(arg, "--lng", "--longitude"))
        {
            target = &options.longitude;
        }

        if (target != nullptr)
        {
            if (!has_value)
            {
                set_error(options, std::string("missing value for ") + arg);
                continue;
            }
            *target = argv[++i];
        }
        else if (matches(arg, "--degrees"))
        {
            options.output_degrees = true;
        }
        else if (matches(arg, "--help", "-h"))
        {
            options.show_help = true;
        }
        else if (matches(arg, "--log-level"))
        {
            if (!has_value)
            {
                set_error(options, "missing value for --log-level");
                continue;
            }
            const std::string name = argv[++i];
            const auto level = spdlog::level::from_str(name);
            // from_str maps unknown names to "off"
            if (level == spdlog::level::off && name != "off")
            {
                set_error(options, "unknown log level '" + name + "'");
                continue;
            }
            options.logger.level = level;
        }
        else if (matches(arg, "--log-file"))
        {
            if (!has_value)
            {
                set_error(options, "missing value for --log-file");
                continue;
            }
            options.logger.log_file = argv[++i];
            options.logger.enable_file_sink = true;
        }
        else if (matches(arg, "--no-log-file"))
        {
            options.logger.enable_file_sink = false;
        }
        else
        {
            set_error(options, std::string("unknown argument '") + arg + "'");
        }
    }

    return options;
}

std::string usage_text(const char* program_name)
{
    std::string usage = "Usage: ";
    usage += program_name;
    usage += " [options]\n"
             "\n"
             "Computes the apparent azimuth and altitude of the Sun.\n"
             "Values not given on the command line are prompted for.\n"
             "\n"
             "  -d, --date \"YYYY-MM-DD HH:MM:SS\"  UTC date and time\n"
             "  --lat, --latitude DEG            Latitude in degrees, north positive\n"
             "  --lng, --longitude DEG           Longitude in degrees, east positive\n"
             "  --degrees                        Print angles in degrees\n"
             "  --log-level LEVEL                trace, debug, info, warn, error, critical, off\n"
             "  --log-file PATH                  Rotating log file (default sunward.log)\n"
             "  --no-log-file                    Log to the console only\n"
             "  -h, --help                       Show this help\n";
    return usage;
}

} // namespace sunward::app
