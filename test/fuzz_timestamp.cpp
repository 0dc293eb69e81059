#include <cstddef>
#include <stdexcept>
#include <string>

#include "ics_timestamp.hpp"

extern "C" int LLVMFuzzerTestOneInput(const char* data, size_t size) {
    std::string s(data, size);

    try {
        IcsTimestamp t;
        t.parse(s);
        if (t.to_string() != s) {
            __builtin_trap();
        }
    } catch (const std::invalid_argument&) {
        return 0;
    }

    return 0;
}
