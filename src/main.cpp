#include <cstdio>
#include <cstdlib>
#include <print>
#include <string_view>
#include <vector>

#include "schedule_munger.hpp"

// Moves the times sched.com exported for the AST leg of the cruise back by
// the zone difference.
//
//   schedule-munger schedule.ics > munged.ics
//
// Then replace the seed schedule.ics with munged.ics, or upload it through
// the admin schedule update page.
int main(int argc, char* argv[]) {
    std::vector<std::string_view> args(argv + 1, argv + argc);

    auto options = parse_arguments(args);
    if (!options) {
        std::println("{}", usage_text);
        return options.error().exit_status();
    }

    options->trace = trace_enabled(std::getenv("SCHEDULE_MUNGER_TRACE"));

    auto output = run(*options);
    if (!output) {
        std::println(stderr, "{}", output.error().what());
        return output.error().exit_status();
    }

    if (options->output_path) {
        auto written = write_schedule(*options->output_path, *output);
        if (!written) {
            std::println(stderr, "{}", written.error().what());
            return written.error().exit_status();
        }
        return EXIT_SUCCESS;
    }

    std::print("{}", *output);
    return EXIT_SUCCESS;
}
