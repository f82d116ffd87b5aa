#include "vm/stdlib/stdlib.h"
#include <dao/runtime.h>
#include <dao/value.h>
#include <print>
#include <cstdio>

namespace dao::natives::io {

// Booleans print the way scripts spell them; text prints raw.
static std::string render(const Value& value) {
    if (value.is_null()) return "FALSE";
    if (value.is_true()) return "TRUE";
    if (const auto* text = value.as_if_string()) return *text;
    return to_string(value);
}

// Arguments sit on the stack in call order.
static std::string join_arguments(Runtime& runtime) {
    std::string line;
    for (const Value& arg : runtime.stack()) line += render(arg);
    return line;
}

static Value print(Runtime& runtime) {
    std::string line = join_arguments(runtime);
    std::println(stdout, "{}", line);
    return Value(std::move(line));
}

static Value error(Runtime& runtime) {
    std::string line = join_arguments(runtime);
    std::println(stderr, "{}", line);
    return Value(std::move(line));
}

} // namespace dao::natives::io

namespace dao::stdlib {

NativeModule create_io_module() {
    NativeModule mod;

    auto reg = [&](const char* name, native_t fn) {
        mod.method(Label(name), std::move(fn));
    };

    using namespace dao::natives::io;

    reg("print", print);
    reg("error", error);

    return mod;
}

} // namespace dao::stdlib

namespace dao {

void install_basic_io(Runtime& runtime) {
    using namespace dao::natives::io;
    runtime.install_system_call(Address("print"), print);
    runtime.install_system_call(Address("error"), error);
}

}
