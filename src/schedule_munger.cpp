#include <algorithm>
#include <chrono>
#include <cstdio>
#include <expected>
#include <format>
#include <print>
#include <stdexcept>
#include <string>
#include <string_view>

#include "ics_line.hpp"
#include "ics_timestamp.hpp"
#include "schedule_file.hpp"
#include "schedule_munger.hpp"
#include "string_utils.hpp"

using namespace std::chrono_literals;

static constexpr std::string_view crlf = "\r\n";

CorrectionWindow CorrectionWindow::compiled_in() {
    using namespace std::chrono;

    return CorrectionWindow{
        ._start = IcsTimestamp(sys_days{2022y / March / 8} + 6h),
        ._end = IcsTimestamp(sys_days{2022y / March / 9} + 6h),
        ._offset = 1h,
    };
}

CorrectedLine correct_line(std::string_view line, const CorrectionWindow& window) {
    IcsLine ics(line);

    if (!ics._property.is_timestamp()) {
        return {std::string(line), LineStatus::passthrough};
    }

    IcsTimestamp t;
    try {
        t.parse(ics._value);
    } catch (const std::invalid_argument&) {
        return {std::string(line), LineStatus::unparsable};
    }

    if (!window.contains(t)) {
        return {std::string(line), LineStatus::outside_window};
    }

    IcsTimestamp corrected = t - window._offset;
    return {std::format("{}:{}", ics._key, corrected.to_string()), LineStatus::corrected};
}

std::string munge_text(std::string_view text, const CorrectionWindow& window, bool trace) {
    std::string result;
    result.reserve(text.length() + text.length() / 8);

    size_t lines_read = 0;
    size_t lines_corrected = 0;

    for (auto line : split_lines(text)) {
        if (line.empty()) {
            continue;
        }

        ++lines_read;
        CorrectedLine out = correct_line(line, window);
        if (out._status == LineStatus::corrected) {
            ++lines_corrected;
        }

        if (trace) {
            switch (out._status) {
            case LineStatus::corrected:
                std::println(stderr, "line {}: '{}' -> '{}'", lines_read, line, out._text);
                break;
            case LineStatus::unparsable:
                std::println(stderr, "line {}: '{}' unchanged, unparsable value", lines_read, line);
                break;
            case LineStatus::outside_window:
                std::println(stderr, "line {}: '{}' unchanged, outside correction window",
                             lines_read, line);
                break;
            case LineStatus::passthrough:
                break;
            }
        }

        result.append(out._text);
        result.append(crlf);
    }

    if (trace) {
        std::println(stderr, "{} lines read, {} corrected", lines_read, lines_corrected);
    }

    return result;
}

bool trace_enabled(const char* env_value) {
    if (env_value == nullptr) {
        return false;
    }

    std::string_view sv(env_value);
    return !sv.empty() && sv != "0";
}

static bool is_help_argument(std::string_view arg) {
    return icompare(arg, "-h") || icompare(arg, "--h");
}

std::expected<MungerOptions, MungerError> parse_arguments(std::span<const std::string_view> args) {
    if (args.empty()) {
        return std::unexpected(InvalidArgumentsError("no schedule file given"));
    }

    if (std::ranges::any_of(args, is_help_argument)) {
        return std::unexpected(InvalidArgumentsError("help requested"));
    }

    if (args.size() > 2) {
        return std::unexpected(InvalidArgumentsError("too many arguments"));
    }

    MungerOptions options;
    options.input_path = args[0];
    if (args.size() == 2) {
        options.output_path = args[1];
    }

    return options;
}

static std::string read_schedule(const std::filesystem::path& path) {
    asio::io_context io_context;
    std::string content;

    run_to_completion(io_context, [&]() -> awaitable<void> {
        ScheduleFile file(io_context, path);
        content = co_await file.read_all();
    });

    return content;
}

std::expected<std::string, MungerError> run(const MungerOptions& options) {
    try {
        std::string content = read_schedule(options.input_path);

        if (!is_valid_utf8(content)) {
            throw InvalidEncodingError(options.input_path.string());
        }

        return munge_text(content, options.window, options.trace);
    } catch (const MungerError& e) {
        return std::unexpected(e);
    }
}

std::expected<void, MungerError> write_schedule(const std::filesystem::path& path,
                                                std::string_view text) {
    try {
        asio::io_context io_context;

        run_to_completion(io_context, [&]() -> awaitable<void> {
            OutputFile file(io_context, path);
            co_await file.write(text);
            if (!file.close()) {
                throw UnwritableFileError(path.string());
            }
        });
    } catch (const MungerError& e) {
        return std::unexpected(e);
    }

    return {};
}
