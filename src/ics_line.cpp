#include <string_view>

#include "ics_line.hpp"

IcsLine::IcsLine(std::string_view line) : _raw(line), _key(line) {
    size_t colon = line.find_first_of(':');
    if (colon != std::string_view::npos) {
        _key = line.substr(0, colon);
        _value = line.substr(colon + 1);
        _has_colon = true;
    }

    _property = IcsProperty::from_key(_key);
}
