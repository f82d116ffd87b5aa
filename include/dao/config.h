#pragma once

#include <cstddef>
#include <string_view>

namespace dao {

namespace build {
    static constexpr std::string_view VERSION = "0.3.0";
    static constexpr std::string_view NAME = "dao-vm";
}

struct RuntimeConfig {
    // Print one line per executed command to stderr.
    bool trace = false;

    // Print uncaught errors (with a disassembly window) when they reach the host.
    bool report_errors = true;

    // Nested Local/Call/Sys frames allowed before CallDepthExceeded.
    size_t max_call_depth = 2048;

    // Commands shown on each side of the failing pc in error reports.
    size_t disassembly_context = 3;
};

}
