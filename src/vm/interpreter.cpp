#include "vm/interpreter.h"
#include "vm/handlers/data_ops.h"
#include "vm/handlers/stack_ops.h"
#include "vm/handlers/math_ops.h"
#include "vm/handlers/flow_ops.h"
#include "vm/handlers/module_ops.h"
#include <array>
#include <print>
#include <cstdio>

namespace dao {

namespace {
    using LookupImpl  = Value (*)(const Lookup&, VMState&);
    using CommandImpl = void (*)(const Command&, VMState&);
    using ExprImpl    = Value (*)(const Expression&, VMState&);

    static std::array<LookupImpl, static_cast<size_t>(LookupKind::TOTAL_LOOKUPS)> lookup_table;
    static std::array<CommandImpl, static_cast<size_t>(CommandOp::TOTAL_COMMANDS)> command_table;
    static std::array<ExprImpl, static_cast<size_t>(OpCode::TOTAL_OPCODES)> expr_table;

    static void impl_UNIMPL(const Command& cmd, VMState& state) {
        state.error(ErrorKind::BadInstruction, "unknown command", {{"instruction", handlers::instruction_text(cmd)}});
    }

    static Value impl_UNIMPL_EXPR(const Expression& expr, VMState& state) {
        state.error(ErrorKind::BadInstruction, "unknown operator", {{"instruction", handlers::instruction_text(expr)}});
    }

    static Value impl_UNIMPL_LOOKUP(const Lookup& lookup, VMState& state) {
        state.error(ErrorKind::BadInstruction, "unknown lookup", {{"instruction", Value(disassemble(lookup))}});
    }

    // Opcodes past the end of a table get the fallback handler.
    template <typename Table, typename Enum>
    [[gnu::always_inline]] inline typename Table::value_type pick(const Table& table, Enum op, typename Table::value_type fallback) {
        const auto idx = static_cast<size_t>(op);
        return idx < table.size() ? table[idx] : fallback;
    }

    struct TableInitializer {
        TableInitializer() {
            lookup_table.fill(impl_UNIMPL_LOOKUP);
            command_table.fill(impl_UNIMPL);
            expr_table.fill(impl_UNIMPL_EXPR);

            #define reg(NAME) lookup_table[static_cast<size_t>(LookupKind::NAME)] = handlers::impl_##NAME
            reg(RESULT); reg(CONST); reg(VAR); reg(DEREF); reg(LOOKUP);
            #undef reg

            #define reg(NAME) command_table[static_cast<size_t>(CommandOp::NAME)] = handlers::impl_##NAME

            // Registers / Memory
            reg(LOAD); reg(STORE); reg(UPDATE);

            // Stack
            reg(PUSH); reg(PEEK); reg(POP); reg(CLEAR_FORWARD); reg(CLEAR_REVERSE);

            // Control Flow
            reg(SETJUMP); reg(JUMP); reg(EVAL); reg(DO); reg(RETURN); reg(THROW);

            #undef reg

            #define reg(NAME) expr_table[static_cast<size_t>(OpCode::NAME)] = handlers::impl_##NAME

            reg(TAKE);

            // Math
            reg(NOT); reg(SIZE);
            reg(ADD); reg(SUB); reg(MUL); reg(DIV); reg(MOD);
            reg(GT); reg(GE); reg(LT); reg(LE); reg(EQ); reg(NE);
            reg(AND); reg(OR); reg(XOR); reg(SHIFT_R); reg(SHIFT_L);

            // Data Structures
            reg(APPEND); reg(INDEX);

            // Branching
            reg(IF); reg(IF_NOT);

            // Calls / Modules
            reg(SYS); reg(CALL); reg(LOCAL); reg(GOTO);

            #undef reg
        }
    };

    static TableInitializer init_trigger;

} // namespace anonymous

Value Interpreter::run(VMState& state) {
    auto& ctx = state.ctx;
    while (ctx.in_range()) {
        // Keeps the commands alive if this step replaces the current block.
        Block block = ctx.block_;
        step(state, block[ctx.pc_]);
    }
    return ctx.last_result_;
}

void Interpreter::step(VMState& state, const Command& command) {
    auto& ctx = state.ctx;
    ++ctx.eval_counter_;
    const size_t pc = ctx.pc_++;
    if (state.config.trace) [[unlikely]] {
        std::println(stderr, "[trace] #{} pc={} {}", ctx.eval_counter_, pc, disassemble(command));
    }
    execute(state, command);
}

void Interpreter::execute(VMState& state, const Command& command) {
    pick(command_table, command.op, impl_UNIMPL)(command, state);
}

// Counts as a step of its own; the body does not move pc.
void Interpreter::condition(VMState& state, const Condition& condition) {
    ++state.ctx.eval_counter_;
    const bool is_null = lookup(state, condition.test).is_null();
    const bool run_body = (condition.kind == ConditionKind::WHEN) ? !is_null : is_null;
    if (run_body) execute(state, condition.body);
}

Value Interpreter::eval(VMState& state, const Expression& expression) {
    ++state.ctx.eval_counter_;
    return pick(expr_table, expression.op, impl_UNIMPL_EXPR)(expression, state);
}

Value Interpreter::lookup(VMState& state, const Lookup& lookup) {
    return pick(lookup_table, lookup.kind, impl_UNIMPL_LOOKUP)(lookup, state);
}

}
