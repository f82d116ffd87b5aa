#pragma once

#include <cstdint>
#include <vector>
#include <string>
#include <memory>
#include <functional>
#include <span>
#include "meow_variant.h"

namespace dao {
class Label;
class Address;
class Value;
class Block;
class Runtime;
struct DataRecord;
struct Function;
struct Expression;
}

namespace dao {
using value_t = Value;
using param_t = const value_t&;
using return_t = value_t;

using null_t = std::monostate;
struct true_t {
    constexpr auto operator<=>(const true_t&) const noexcept = default;
};
using int_t = int64_t;
using float_t = double;
using string_t = std::string;
using pointer_t = Address;
using list_t = std::shared_ptr<const std::vector<Value>>;
using data_t = std::shared_ptr<const DataRecord>;
using function_t = std::shared_ptr<const Function>;

// Natives run against the live runtime with the stack holding their arguments.
using native_t = std::function<return_t(Runtime& runtime)>;
// Receives the expression being evaluated and its already evaluated operands.
using evaluator_t = std::function<return_t(Runtime& runtime, const Expression& expr, std::span<const Value> operands)>;

enum class ValueType : uint8_t {
    Null,
    True,
    Int,
    Float,
    String,
    Pointer,
    List,
    Data,
    Function,

    TotalValueTypes
};
}
