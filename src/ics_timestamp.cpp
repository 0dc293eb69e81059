#include <chrono>
#include <format>
#include <spanstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "ics_timestamp.hpp"

void IcsTimestamp::parse(std::string_view value, std::string_view format) {
    if (value.empty()) {
        throw std::invalid_argument("Failed to parse timestamp: empty value");
    }

    std::ispanstream ss{value};
    std::chrono::sys_seconds tp;

    ss >> std::chrono::parse(std::string(format), tp);

    if (ss.fail()) {
        ss.clear();
        throw std::invalid_argument(
            std::format("Failed to parse timestamp at position: {} data: '{}'",
                        std::to_string(ss.tellg()), value));
    }

    if (ss.peek() != std::ispanstream::traits_type::eof()) {
        throw std::invalid_argument(std::format("Trailing data after timestamp: '{}'", value));
    }

    IcsTimestamp parsed(tp);

    // chrono::parse accepts short fields ("2022039T..."), the export never has them
    if (parsed.to_string(format) != value) {
        throw std::invalid_argument(std::format("Timestamp is not in canonical form: '{}'", value));
    }

    _time = tp;
}

const std::string IcsTimestamp::to_string(std::string_view format) const {
    const std::string spec = std::format("{{:{}}}", format);
    return std::vformat(spec, std::make_format_args(_time));
}
