#include <cstddef>
#include <string>
#include <string_view>

#include "schedule_munger.hpp"
#include "string_utils.hpp"

extern "C" int LLVMFuzzerTestOneInput(const char* data, size_t size) {
    std::string_view sv(data, size);
    if (!is_valid_utf8(sv)) {
        return 0;
    }

    std::string out = munge_text(sv, CorrectionWindow::compiled_in());
    if (!out.empty() && !out.ends_with("\r\n")) {
        __builtin_trap();
    }

    return 0;
}
