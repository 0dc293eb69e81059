#pragma once

#include <chrono>
#include <string>
#include <string_view>

// UTC date-time as exported by sched.com, e.g. 20220309T030000Z
inline constexpr std::string_view ics_utc_format = "%Y%m%dT%H%M%SZ";

struct IcsTimestamp {
    IcsTimestamp() {}
    explicit IcsTimestamp(std::chrono::sys_seconds time) : _time(time) {}

    // Throws std::invalid_argument unless the whole value matches the format.
    void parse(std::string_view value, std::string_view format = ics_utc_format);
    const std::string to_string(std::string_view format = ics_utc_format) const;

    IcsTimestamp operator-(std::chrono::seconds offset) const { return IcsTimestamp(_time - offset); }

    bool operator==(const IcsTimestamp& rhs) const = default;
    auto operator<=>(const IcsTimestamp& rhs) const = default;

    std::chrono::sys_seconds _time{};
};
