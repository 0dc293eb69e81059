#pragma once

#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "ics_timestamp.hpp"
#include "munger_errors.hpp"

static constexpr std::string_view usage_text =
    "Pass in a path to a schedule.ics file as first argument\n"
    "usage: schedule-munger <schedule.ics> [<output.ics>]";

// Times in (_start, _end] were exported one zone offset too late.
struct CorrectionWindow {
    bool contains(const IcsTimestamp& t) const { return _start < t && t <= _end; }

    // The 2022 sailing: sched.com kept the ship on EST while it was on AST.
    static CorrectionWindow compiled_in();

    IcsTimestamp _start;
    IcsTimestamp _end;
    std::chrono::seconds _offset;
};

struct MungerOptions {
    std::filesystem::path input_path;
    std::optional<std::filesystem::path> output_path;
    CorrectionWindow window = CorrectionWindow::compiled_in();
    bool trace{false};
};

enum class LineStatus { passthrough, corrected, unparsable, outside_window };

struct CorrectedLine {
    std::string _text;
    LineStatus _status;
};

CorrectedLine correct_line(std::string_view line,
                           const CorrectionWindow& window = CorrectionWindow::compiled_in());
std::string munge_text(std::string_view text, const CorrectionWindow& window, bool trace = false);

bool trace_enabled(const char* env_value);

std::expected<MungerOptions, MungerError> parse_arguments(std::span<const std::string_view> args);
std::expected<std::string, MungerError> run(const MungerOptions& options);
std::expected<void, MungerError> write_schedule(const std::filesystem::path& path,
                                                std::string_view text);
