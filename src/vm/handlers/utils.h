#pragma once

#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <dao/value.h>
#include <dao/cast.h>
#include <dao/signal.h>
#include <dao/bytecode/instruction.h>
#include <dao/bytecode/disassemble.h>
#include <dao/bytecode/op_codes.h>
#include "vm/vm_state.h"
#include "vm/interpreter.h"
#include "module/module_manager.h"
#include "runtime/operator_dispatcher.h"
#include "runtime/execution_context.h"
#include "runtime/call_frame.h"

#define COMMAND_HANDLER [[gnu::hot]] static void
#define EXPR_HANDLER [[gnu::hot]] static Value
#define LOOKUP_HANDLER [[gnu::always_inline]] static Value

namespace dao::handlers {

// Evaluates expressions left to right.
[[gnu::always_inline]]
inline std::vector<Value> eval_all(VMState& state, std::span<const Expression> exprs) {
    std::vector<Value> out;
    out.reserve(exprs.size());
    for (const Expression& e : exprs) out.push_back(Interpreter::eval(state, e));
    return out;
}

[[gnu::always_inline]]
inline Value instruction_text(const Expression& expr) {
    return Value(disassemble(expr));
}

[[gnu::always_inline]]
inline Value instruction_text(const Command& cmd) {
    return Value(disassemble(cmd));
}

// --- Instruction shape ---
// Instructions are plain aggregates, so a host can build one with fields missing.

template <typename Instr>
[[noreturn]] inline void malformed(VMState& state, const Instr& instr, std::string_view problem) {
    state.error(ErrorKind::BadInstruction, problem, {{"instruction", Value(disassemble(instr))}});
}

[[gnu::always_inline]]
inline void require_operands(VMState& state, const Expression& expr, size_t count) {
    if (expr.operands.size() != count) [[unlikely]] {
        malformed(state, expr, "operator has the wrong number of operands");
    }
}

[[gnu::always_inline]]
inline const Address& require_address(VMState& state, const Expression& expr) {
    if (!expr.address) [[unlikely]] malformed(state, expr, "instruction has no address");
    return *expr.address;
}

[[gnu::always_inline]]
inline const Label& require_label(VMState& state, const Lookup& lookup) {
    if (!lookup.label) [[unlikely]] malformed(state, lookup, "lookup has no label");
    return *lookup.label;
}

[[gnu::always_inline]]
inline const Address& require_module(VMState& state, const Lookup& lookup) {
    if (!lookup.module) [[unlikely]] malformed(state, lookup, "lookup has no module address");
    return *lookup.module;
}

[[gnu::always_inline]]
inline const Label& require_label(VMState& state, const Command& cmd) {
    if (!cmd.label) [[unlikely]] malformed(state, cmd, "command has no label");
    return *cmd.label;
}

[[gnu::always_inline]]
inline const Expression& require_expression(VMState& state, const Command& cmd) {
    if (!cmd.expression) [[unlikely]] malformed(state, cmd, "command has no expression");
    return *cmd.expression;
}

[[gnu::always_inline]]
inline const Condition& require_condition(VMState& state, const Command& cmd) {
    if (!cmd.condition) [[unlikely]] malformed(state, cmd, "command has no condition");
    return *cmd.condition;
}

} // namespace dao::handlers
