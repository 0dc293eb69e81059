#ifndef INCLUDE_ICS_LINE_HPP_
#define INCLUDE_ICS_LINE_HPP_

#include <array>
#include <cstddef>
#include <string_view>

class IcsProperty {
  public:
    enum class type_id { other = 0, dtstart, dtend };

    constexpr bool is_timestamp() const {
        switch (_type) {
        case type_id::dtstart:
        case type_id::dtend:
            return true;
        default:
            return false;
        }
    }

    // Exact match only; "DTSTART;TZID=..." and lowercase keys are other.
    static constexpr IcsProperty from_key(std::string_view key) {
        for (size_t i = 1; i < _name.size(); ++i) {
            if (key == _name[i]) {
                return IcsProperty(static_cast<type_id>(i));
            }
        }
        return IcsProperty(type_id::other);
    }

    constexpr IcsProperty(type_id type) : _type(type) {}
    constexpr type_id get_id() const { return _type; }
    constexpr const std::string_view get_name() const { return _name[static_cast<int>(_type)]; }

    constexpr bool operator==(const IcsProperty& rhs) const { return _type == rhs._type; }

  private:
    static constexpr std::array<std::string_view, 3> _name = {"", "DTSTART", "DTEND"};
    type_id _type;
};

// One physical line of an .ics file. Views point into the caller's buffer.
struct IcsLine {
    explicit IcsLine(std::string_view line);

    std::string_view _raw;
    std::string_view _key;
    std::string_view _value;
    bool _has_colon{false};
    IcsProperty _property{IcsProperty::type_id::other};
};

#endif /* INCLUDE_ICS_LINE_HPP_ */
