#pragma once
#include "vm/handlers/utils.h"
#include <array>

namespace dao::handlers {

// Primitive table first, then the evaluator of the builtin module owning a Data operand.
[[gnu::always_inline]]
inline Value apply_operator(VMState& state, const Expression& expr, std::span<const Value> args) {
    if (args.size() == 2) {
        if (auto fn = OperatorDispatcher::find(expr.op, args[0], args[1])) [[likely]] return fn(args[0], args[1]);
    } else if (args.size() == 1) {
        if (auto fn = OperatorDispatcher::find(expr.op, args[0])) [[likely]] return fn(args[0]);
    }

    for (const Value& arg : args) {
        const DataRecord* record = arg.as_if_data();
        if (!record) continue;
        if (const evaluator_t* evaluator = state.modules.find_evaluator(record->tag)) {
            return (*evaluator)(state.runtime, expr, args);
        }
        state.error(ErrorKind::BadInstruction, "no operator evaluator is installed for this data type",
                    {{"instruction", instruction_text(expr)}, {"dataType", Value(record->tag)}});
    }

    state.error(ErrorKind::BadInstruction, "evaluated operator on incorrect type of data",
                {{"instruction", instruction_text(expr)}});
}

EXPR_HANDLER impl_TAKE(const Expression& expr, VMState& state) {
    return Interpreter::lookup(state, expr.target);
}

EXPR_HANDLER op_unary(const Expression& expr, VMState& state) {
    require_operands(state, expr, 1);
    std::array<Value, 1> args{Interpreter::eval(state, expr.operands[0])};
    return apply_operator(state, expr, args);
}

EXPR_HANDLER op_binary(const Expression& expr, VMState& state) {
    require_operands(state, expr, 2);
    Value lhs = Interpreter::eval(state, expr.operands[0]);
    Value rhs = Interpreter::eval(state, expr.operands[1]);
    std::array<Value, 2> args{std::move(lhs), std::move(rhs)};
    return apply_operator(state, expr, args);
}

#define impl_unary(NAME) \
    EXPR_HANDLER impl_##NAME(const Expression& expr, VMState& state) { return op_unary(expr, state); }
#define impl_binary(NAME) \
    EXPR_HANDLER impl_##NAME(const Expression& expr, VMState& state) { return op_binary(expr, state); }

impl_unary(NOT) impl_unary(SIZE)

impl_binary(ADD) impl_binary(SUB) impl_binary(MUL) impl_binary(DIV) impl_binary(MOD)
impl_binary(GT) impl_binary(GE) impl_binary(LT) impl_binary(LE)
impl_binary(APPEND) impl_binary(INDEX)
impl_binary(AND) impl_binary(OR) impl_binary(XOR) impl_binary(SHIFT_R) impl_binary(SHIFT_L)

#undef impl_unary
#undef impl_binary

// Structural equality over any pair of values.
EXPR_HANDLER impl_EQ(const Expression& expr, VMState& state) {
    require_operands(state, expr, 2);
    Value lhs = Interpreter::eval(state, expr.operands[0]);
    Value rhs = Interpreter::eval(state, expr.operands[1]);
    return Value::boolean(lhs == rhs);
}

EXPR_HANDLER impl_NE(const Expression& expr, VMState& state) {
    require_operands(state, expr, 2);
    Value lhs = Interpreter::eval(state, expr.operands[0]);
    Value rhs = Interpreter::eval(state, expr.operands[1]);
    return Value::boolean(lhs != rhs);
}

// --- Ternary ---

[[gnu::always_inline]]
inline Value select_branch(const Expression& expr, VMState& state, bool take_on) {
    require_operands(state, expr, 3);
    Value cond = Interpreter::eval(state, expr.operands[0]);
    std::optional<bool> flag = as_bool(cond);
    if (!flag) [[unlikely]] {
        state.error(ErrorKind::BadInstruction, "conditional does not evaluate to boolean value",
                    {{"instruction", instruction_text(expr)}});
    }
    return Interpreter::eval(state, expr.operands[*flag == take_on ? 1 : 2]);
}

EXPR_HANDLER impl_IF(const Expression& expr, VMState& state) {
    return select_branch(expr, state, true);
}

EXPR_HANDLER impl_IF_NOT(const Expression& expr, VMState& state) {
    return select_branch(expr, state, false);
}

} // namespace dao::handlers
