/// @file test_application.cpp
/// @brief Unit tests for the command-line layer: option parsing, text input
///        parsing, report formatting and the Application flow.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "app/application.hpp"
#include "app/cli_options.hpp"
#include "app/input_parser.hpp"
#include "app/report.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <cmath>
#include <sstream>
#include <string>
#include <vector>

using namespace sunward;
using namespace sunward::app;

// =================================================================
// Custom main: initialize logger before tests
// =================================================================

int main(int argc, char** argv)
{
    core::Logger::init(core::LoggerConfig{
        .level = spdlog::level::critical,
        .enable_file_sink = false,
    });
    const int result = doctest::Context(argc, argv).run();
    core::Logger::shutdown();
    return result;
}

// =================================================================
// Helpers
// =================================================================

namespace
{

CliOptions parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "sunward");
    return parse_cli_options(static_cast<int>(args.size()), args.data());
}

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // anonymous namespace

// =================================================================
// Command-line options
// =================================================================

TEST_CASE("All options are recognized")
{
    const CliOptions options = parse({
        "--date", "2025-02-11 11:25:18",
        "--lat", "51.2",
        "--lng", "-3.5",
        "--degrees",
        "--log-level", "debug",
        "--log-file", "run.log",
    });

    CHECK_FALSE(options.had_parse_error);
    REQUIRE(options.date);
    CHECK(*options.date == "2025-02-11 11:25:18");
    REQUIRE(options.latitude);
    CHECK(*options.latitude == "51.2");
    REQUIRE(options.longitude);
    CHECK(*options.longitude == "-3.5");
    CHECK(options.output_degrees);
    CHECK(options.logger.level == spdlog::level::debug);
    CHECK(options.logger.log_file == "run.log");
    CHECK(options.logger.enable_file_sink);
}

TEST_CASE("Missing values stay empty so they can be prompted for")
{
    const CliOptions options = parse({"-d", "2025-02-11 11:25:18"});

    CHECK_FALSE(options.had_parse_error);
    CHECK(options.date);
    CHECK_FALSE(options.latitude);
    CHECK_FALSE(options.longitude);
    CHECK_FALSE(options.output_degrees);
}

TEST_CASE("Command-line errors are reported, not thrown")
{
    SUBCASE("Unknown argument")
    {
        const CliOptions options = parse({"--frobnicate"});
        CHECK(options.had_parse_error);
        CHECK(contains(options.error_message, "--frobnicate"));
    }
    SUBCASE("Option without its value")
    {
        const CliOptions options = parse({"--lat"});
        CHECK(options.had_parse_error);
        CHECK(contains(options.error_message, "--lat"));
    }
    SUBCASE("Unknown log level")
    {
        const CliOptions options = parse({"--log-level", "loud"});
        CHECK(options.had_parse_error);
        CHECK(contains(options.error_message, "loud"));
    }
}

// =================================================================
// Logger setup
// =================================================================

TEST_CASE("Unwritable log file falls back to console logging")
{
    CHECK_NOTHROW(core::Logger::init(core::LoggerConfig{
        .level = spdlog::level::critical,
        .log_file = "/proc/sunward_unwritable.log",
    }));
    REQUIRE(core::Logger::is_initialized());
    CHECK(core::Logger::get_core_logger()->sinks().size() == 1);
    CHECK(core::Logger::get_app_logger()->sinks().size() == 1);

    core::Logger::init(core::LoggerConfig{
        .level = spdlog::level::critical,
        .enable_file_sink = false,
    });
}

TEST_CASE("Log macros are safe outside init/shutdown")
{
    core::Logger::shutdown();
    REQUIRE_FALSE(core::Logger::is_initialized());
    CHECK_NOTHROW(SWD_DEBUG("before init {}", 1));
    CHECK_NOTHROW(SWD_CORE_DEBUG("before init {}", 2));
    CHECK_FALSE(InputParser::parse_degrees("north").has_value());

    core::Logger::init(core::LoggerConfig{
        .level = spdlog::level::critical,
        .enable_file_sink = false,
    });
}

TEST_CASE("--no-log-file disables the file sink and --help is recorded")
{
    const CliOptions options = parse({"--no-log-file", "-h"});
    CHECK_FALSE(options.logger.enable_file_sink);
    CHECK(options.show_help);
    CHECK(contains(usage_text("sunward"), "--longitude"));
}

// =================================================================
// Input parsing
// =================================================================

TEST_CASE("Date in the interactive format")
{
    const auto dt = InputParser::parse_date_time("2025-02-11 11:25:18");
    REQUIRE(dt);
    CHECK(dt->year == 2025);
    CHECK(dt->month == 2);
    CHECK(dt->day == 11);
    CHECK(dt->hour == 11);
    CHECK(dt->minute == 25);
    CHECK(dt->second == 18.0);
}

TEST_CASE("ISO 8601 date with fraction and Z suffix")
{
    const auto dt = InputParser::parse_date_time("  2024-12-21T02:07:30.5Z ");
    REQUIRE(dt);
    CHECK(dt->day == 21);
    CHECK(dt->hour == 2);
    CHECK(dt->minute == 7);
    CHECK(dt->second == doctest::Approx(30.5));
}

TEST_CASE("Seconds are optional")
{
    const auto dt = InputParser::parse_date_time("2025-06-21 12:00");
    REQUIRE(dt);
    CHECK(dt->minute == 0);
    CHECK(dt->second == 0.0);
}

TEST_CASE("Malformed dates are rejected")
{
    for (const char* text : {"", "2025-02-11", "2025/02/11 10:00:00", "yesterday",
                             "2025-02-11 10:xx:00", "2025-02 10:00:00", "2025-02-11 1000"})
    {
        CAPTURE(text);
        CHECK_FALSE(InputParser::parse_date_time(text));
    }
}

TEST_CASE("Degrees accept signs and surrounding whitespace")
{
    CHECK(InputParser::parse_degrees("51.21131496342009").value() == doctest::Approx(51.21131496342009));
    CHECK(InputParser::parse_degrees(" -3.5\n").value() == doctest::Approx(-3.5));
    CHECK(InputParser::parse_degrees("+45").value() == doctest::Approx(45.0));

    CHECK_FALSE(InputParser::parse_degrees(""));
    CHECK_FALSE(InputParser::parse_degrees("north"));
    CHECK_FALSE(InputParser::parse_degrees("51.2N"));
    CHECK_FALSE(InputParser::parse_degrees("+-3"));
}

// =================================================================
// Report formatting
// =================================================================

TEST_CASE("Dates print with fractional seconds only when present")
{
    CHECK(format_date_time(astro::DateTime{2025, 2, 11, 11, 25, 18.0}) == "2025-02-11 11:25:18");
    CHECK(format_date_time(astro::DateTime{2024, 12, 1, 2, 7, 5.25}) == "2024-12-01 02:07:05.250");
}

TEST_CASE("Report in degrees includes the compass bearing")
{
    const std::string report = format_report(
        astro::DateTime{2025, 2, 11, 11, 25, 18.0},
        astro::GeoCoordinate{.latitude_deg = 51.2, .longitude_deg = 3.2},
        astro::HorizontalCoord{.azimuth = -0.1692914942885581, .altitude = 0.42434427805794117},
        true);

    CHECK(contains(report, "On 2025-02-11 11:25:18, at latitude: 51.2 and longitude: 3.2, the sun is at\n"));
    CHECK(contains(report, " a) azimuth: -9.6997 deg (compass bearing 170.3003 deg)\n"));
    CHECK(contains(report, " b) altitude: 24.3131 deg\n"));
}

// =================================================================
// Application flow
// =================================================================

TEST_CASE("Arguments only: prints the Bruges position in radians")
{
    const CliOptions options = parse({
        "--date", "2025-02-11 11:25:18",
        "--lat", "51.21131496342009",
        "--lng", "3.2258847770102235",
    });

    std::istringstream in;
    std::ostringstream out;
    Application application(options, in, out);

    CHECK(application.run() == ExitCode::Success);
    CHECK(contains(out.str(),
                   "On 2025-02-11 11:25:18, at latitude: 51.21131496342009 and "
                   "longitude: 3.2258847770102235, the sun is at\n"));
    CHECK(contains(out.str(), " a) azimuth: -0.169291494"));
    CHECK(contains(out.str(), " b) altitude: 0.424344278"));
}

TEST_CASE("Missing values are prompted for")
{
    std::istringstream in("2025-02-11 11:25:18\n51.21131496342009\n3.2258847770102235\n");
    std::ostringstream out;
    Application application(CliOptions{}, in, out);

    CHECK(application.run() == ExitCode::Success);
    CHECK(contains(out.str(), "Enter date and time (in format: 2025-02-11 11:25:18): "));
    CHECK(contains(out.str(), "Enter latitude: "));
    CHECK(contains(out.str(), "Enter longitude: "));
    CHECK(contains(out.str(), " b) altitude: 0.424344278"));
}

TEST_CASE("Invalid input maps to exit code 1")
{
    std::ostringstream out;

    SUBCASE("Input ends early")
    {
        std::istringstream in("2025-02-11 11:25:18\n");
        Application application(CliOptions{}, in, out);
        CHECK(application.run() == ExitCode::InvalidInput);
    }
    SUBCASE("Latitude out of range")
    {
        std::istringstream in("2025-02-11 11:25:18\n91\n0\n");
        Application application(CliOptions{}, in, out);
        CHECK(application.run() == ExitCode::InvalidInput);
    }
    SUBCASE("Longitude out of range")
    {
        std::istringstream in("2025-02-11 11:25:18\n0\n200\n");
        Application application(CliOptions{}, in, out);
        CHECK(application.run() == ExitCode::InvalidInput);
    }
    SUBCASE("Impossible date")
    {
        std::istringstream in("2025-02-30 11:25:18\n10\n10\n");
        Application application(CliOptions{}, in, out);
        CHECK(application.run() == ExitCode::InvalidInput);
    }
    SUBCASE("Unparseable latitude")
    {
        std::istringstream in("2025-02-11 11:25:18\nfifty\n10\n");
        Application application(CliOptions{}, in, out);
        CHECK(application.run() == ExitCode::InvalidInput);
    }

    CHECK_FALSE(contains(out.str(), "the sun is at"));
}

TEST_CASE("Command-line errors map to exit code 2")
{
    std::istringstream in;
    std::ostringstream out;
    Application application(parse({"--bogus"}), in, out);

    CHECK(application.run() == ExitCode::UsageError);
}
