#pragma once
#include <array>
#include <utility>
#include <dao/bytecode/op_codes.h>
#include <dao/value.h>

namespace dao {

constexpr size_t TYPE_BITS = 4;
constexpr size_t OP_BITS = 5;

constexpr size_t BINARY_TABLE_SIZE = (1 << OP_BITS) * (1 << TYPE_BITS) * (1 << TYPE_BITS);
constexpr size_t UNARY_TABLE_SIZE  = (1 << OP_BITS) * (1 << TYPE_BITS);

static_assert(std::to_underlying(OpCode::TOTAL_OPCODES) <= (1 << OP_BITS));
static_assert(std::to_underlying(ValueType::TotalValueTypes) <= (1 << TYPE_BITS));

using binary_function_t = return_t (*)(param_t, param_t);
using unary_function_t  = return_t (*)(param_t);

// Primitive operator table. A null entry means the operand shapes are not
// supported natively; the caller then tries a module evaluator or reports
// BadInstruction.
class OperatorDispatcher {
public:
    [[nodiscard]]
    [[gnu::always_inline]] static binary_function_t find(OpCode op, param_t lhs, param_t rhs) noexcept {
        const size_t op_idx = std::to_underlying(op);
        const size_t t1 = lhs.index();
        const size_t t2 = rhs.index();

        const size_t idx = (op_idx << (TYPE_BITS * 2)) | (t1 << TYPE_BITS) | t2;
        return binary_dispatch_table_[idx];
    }

    [[nodiscard]]
    [[gnu::always_inline]] static unary_function_t find(OpCode op, param_t rhs) noexcept {
        const size_t op_idx = std::to_underlying(op);
        const size_t idx = (op_idx << TYPE_BITS) | rhs.index();
        return unary_dispatch_table_[idx];
    }

private:
    static const std::array<binary_function_t, BINARY_TABLE_SIZE> binary_dispatch_table_;
    static const std::array<unary_function_t, UNARY_TABLE_SIZE> unary_dispatch_table_;
};

}
