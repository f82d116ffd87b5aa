/**
 * @file stdlib.h
 * @brief Factory definitions for the native standard modules
 */
#pragma once

#include <dao/core/module.h>

namespace dao::stdlib {
    // `print` and `error` as methods of a builtin module.
    [[nodiscard]] NativeModule create_io_module();
}
