#include "runtime/operator_dispatcher.h"
#include <dao/signal.h>
#include <cmath>
#include <cstdint>
#include <limits>

namespace dao {

// Int arithmetic wraps around like the machine word.
[[gnu::always_inline]]
static inline int_t wrap_add(int_t a, int_t b) noexcept {
    return static_cast<int_t>(static_cast<uint64_t>(a) + static_cast<uint64_t>(b));
}

[[gnu::always_inline]]
static inline int_t wrap_sub(int_t a, int_t b) noexcept {
    return static_cast<int_t>(static_cast<uint64_t>(a) - static_cast<uint64_t>(b));
}

[[gnu::always_inline]]
static inline int_t wrap_mul(int_t a, int_t b) noexcept {
    return static_cast<int_t>(static_cast<uint64_t>(a) * static_cast<uint64_t>(b));
}

static void require_divisor(int_t b) {
    if (b == 0) [[unlikely]] throw_error(ErrorKind::BadInstruction, "integer division by zero");
}

// Rounds toward negative infinity.
static int_t floor_div(int_t a, int_t b) {
    require_divisor(b);
    if (b == -1) return wrap_sub(0, a);
    int_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// Result takes the sign of the divisor.
static int_t floor_mod(int_t a, int_t b) {
    require_divisor(b);
    if (b == -1) return 0;
    int_t r = a % b;
    if (r != 0 && ((r < 0) != (b < 0))) r += b;
    return r;
}

// A negative amount shifts the other way; shifting past the word width saturates.
static int_t shift_left(int_t a, int_t n) noexcept;

static int_t shift_right(int_t a, int_t n) noexcept {
    if (n < 0) return n == std::numeric_limits<int_t>::min() ? 0 : shift_left(a, -n);
    if (n >= 64) return a < 0 ? -1 : 0;
    return a >> n;
}

static int_t shift_left(int_t a, int_t n) noexcept {
    if (n < 0) return n == std::numeric_limits<int_t>::min() ? (a < 0 ? -1 : 0) : shift_right(a, -n);
    if (n >= 64) return 0;
    return static_cast<int_t>(static_cast<uint64_t>(a) << n);
}

static Value concat_lists(param_t a, param_t b) {
    auto x = a.as_list();
    auto y = b.as_list();
    std::vector<Value> out;
    out.reserve(x.size() + y.size());
    out.insert(out.end(), x.begin(), x.end());
    out.insert(out.end(), y.begin(), y.end());
    return Value::list(std::move(out));
}

// --- Index Calculation ---
consteval size_t calc_bin_idx(OpCode op, ValueType lhs, ValueType rhs) {
    return (std::to_underlying(op) << (TYPE_BITS * 2)) | (std::to_underlying(lhs) << TYPE_BITS) | std::to_underlying(rhs);
}

consteval size_t calc_un_idx(OpCode op, ValueType rhs) {
    return (std::to_underlying(op) << TYPE_BITS) | std::to_underlying(rhs);
}

consteval auto make_binary_table() {
    std::array<binary_function_t, BINARY_TABLE_SIZE> table;
    table.fill(nullptr);

    auto reg = [&](OpCode op, ValueType t1, ValueType t2, binary_function_t f) {
        table[calc_bin_idx(op, t1, t2)] = f;
    };

    using enum OpCode;
    using enum ValueType;

    // ARITHMETIC (matching numeric pairs only)
    reg(ADD, Int, Int,     [](param_t a, param_t b) { return Value(wrap_add(a.as_int(), b.as_int())); });
    reg(ADD, Float, Float, [](param_t a, param_t b) { return Value(a.as_float() + b.as_float()); });
    reg(SUB, Int, Int,     [](param_t a, param_t b) { return Value(wrap_sub(a.as_int(), b.as_int())); });
    reg(SUB, Float, Float, [](param_t a, param_t b) { return Value(a.as_float() - b.as_float()); });
    reg(MUL, Int, Int,     [](param_t a, param_t b) { return Value(wrap_mul(a.as_int(), b.as_int())); });
    reg(MUL, Float, Float, [](param_t a, param_t b) { return Value(a.as_float() * b.as_float()); });
    reg(DIV, Int, Int,     [](param_t a, param_t b) { return Value(floor_div(a.as_int(), b.as_int())); });
    reg(DIV, Float, Float, [](param_t a, param_t b) { return Value(a.as_float() / b.as_float()); });
    reg(MOD, Int, Int,     [](param_t a, param_t b) { return Value(floor_mod(a.as_int(), b.as_int())); });

    // COMPARISON
    reg(GT, Int, Int,     [](param_t a, param_t b) { return Value::boolean(a.as_int() > b.as_int()); });
    reg(GE, Int, Int,     [](param_t a, param_t b) { return Value::boolean(a.as_int() >= b.as_int()); });
    reg(LT, Int, Int,     [](param_t a, param_t b) { return Value::boolean(a.as_int() < b.as_int()); });
    reg(LE, Int, Int,     [](param_t a, param_t b) { return Value::boolean(a.as_int() <= b.as_int()); });
    reg(GT, Float, Float, [](param_t a, param_t b) { return Value::boolean(a.as_float() > b.as_float()); });
    reg(GE, Float, Float, [](param_t a, param_t b) { return Value::boolean(a.as_float() >= b.as_float()); });
    reg(LT, Float, Float, [](param_t a, param_t b) { return Value::boolean(a.as_float() < b.as_float()); });
    reg(LE, Float, Float, [](param_t a, param_t b) { return Value::boolean(a.as_float() <= b.as_float()); });

    // APPEND
    reg(APPEND, String, String, [](param_t a, param_t b) { return Value(a.as_string() + b.as_string()); });
    reg(APPEND, List, List,     [](param_t a, param_t b) { return concat_lists(a, b); });

    // BITWISE
    reg(AND,     Int, Int, [](param_t a, param_t b) { return Value(a.as_int() & b.as_int()); });
    reg(OR,      Int, Int, [](param_t a, param_t b) { return Value(a.as_int() | b.as_int()); });
    reg(XOR,     Int, Int, [](param_t a, param_t b) { return Value(a.as_int() ^ b.as_int()); });
    reg(SHIFT_R, Int, Int, [](param_t a, param_t b) { return Value(shift_right(a.as_int(), b.as_int())); });
    reg(SHIFT_L, Int, Int, [](param_t a, param_t b) { return Value(shift_left(a.as_int(), b.as_int())); });

    // INDEX
    reg(INDEX, Int, List, [](param_t i, param_t l) {
        auto items = l.as_list();
        const int_t at = i.as_int();
        if (at < 0 || static_cast<size_t>(at) >= items.size()) return Value();
        return items[static_cast<size_t>(at)];
    });
    reg(INDEX, String, Data, [](param_t name, param_t d) {
        if (!Label::is_valid(name.as_string())) return Value();
        const Value* field = d.as_data().field(Label(name.as_string()));
        return field ? *field : Value();
    });
    reg(INDEX, True, Data, [](param_t, param_t d) { return Value(d.as_data().tag); });

    return table;
}

consteval auto make_unary_table() {
    std::array<unary_function_t, UNARY_TABLE_SIZE> table;
    table.fill(nullptr);

    auto reg = [&](OpCode op, ValueType t, unary_function_t f) {
        table[calc_un_idx(op, t)] = f;
    };

    using enum OpCode;
    using enum ValueType;

    reg(NOT, Null, [](param_t) { return Value::truth(); });
    reg(NOT, True, [](param_t) { return Value::null(); });
    reg(NOT, Int,  [](param_t v) { return Value(~v.as_int()); });

    // SIZE doubles as absolute value on numbers.
    reg(SIZE, Null,   [](param_t) { return Value::null(); });
    reg(SIZE, True,   [](param_t) { return Value::truth(); });
    reg(SIZE, Int,    [](param_t v) {
        const int_t i = v.as_int();
        return Value(i < 0 ? wrap_sub(0, i) : i);
    });
    reg(SIZE, Float,  [](param_t v) { return Value(std::fabs(v.as_float())); });
    reg(SIZE, String, [](param_t v) { return Value(v.as_string().size()); });
    reg(SIZE, List,   [](param_t v) { return Value(v.as_list().size()); });

    return table;
}

constinit const std::array<binary_function_t, BINARY_TABLE_SIZE> OperatorDispatcher::binary_dispatch_table_ = make_binary_table();
constinit const std::array<unary_function_t, UNARY_TABLE_SIZE> OperatorDispatcher::unary_dispatch_table_  = make_unary_table();

}
