#pragma once
#include "vm/handlers/utils.h"

namespace dao::handlers {

// --- Jumps ---

COMMAND_HANDLER impl_SETJUMP(const Command&, VMState&) {
    // Only consulted when the block is installed.
}

COMMAND_HANDLER impl_JUMP(const Command& cmd, VMState& state) {
    auto& ctx = state.ctx;
    const Label& name = require_label(state, cmd);
    const size_t* target = ctx.jumps_.find(name);
    if (!target || !ctx.block_.contains(*target)) [[unlikely]] {
        state.error(ErrorKind::UndefinedJumpTarget, "no jump target with this name in the current block",
                    {{"target", Value(name.str())}});
    }
    ctx.pc_ = *target;
}

// --- Evaluation ---

COMMAND_HANDLER impl_EVAL(const Command& cmd, VMState& state) {
    Value result = Interpreter::eval(state, require_expression(state, cmd));
    state.ctx.last_result_ = std::move(result);
}

COMMAND_HANDLER impl_DO(const Command& cmd, VMState& state) {
    Interpreter::condition(state, require_condition(state, cmd));
}

// --- Unwinding ---

COMMAND_HANDLER impl_RETURN(const Command& cmd, VMState& state) {
    throw Signal::returning(Interpreter::lookup(state, cmd.lookup));
}

COMMAND_HANDLER impl_THROW(const Command& cmd, VMState& state) {
    throw Signal::error(Interpreter::lookup(state, cmd.lookup));
}

// --- Call protocol ---

struct CallOutcome {
    Value value;
    bool returned;  // false when the callee fell off the end of its block
};

[[gnu::always_inline]]
inline const Function& require_function(VMState& state, const Value& callee, const Lookup& target, std::string_view problem) {
    const Function* fn = as_func(callee);
    if (!fn) [[unlikely]] {
        state.error(ErrorKind::BadInstruction, problem, {{"target", Value(disassemble(target))}});
    }
    return *fn;
}

// Pairs parameters with the stack (oldest first) followed by `args`; unpaired values stay on the stack.
inline void bind_arguments(VMState& state, const Function& fn, std::vector<Value> args) {
    auto& ctx = state.ctx;
    if (ctx.stack_.size() + args.size() < fn.params.size()) [[unlikely]] {
        state.error(ErrorKind::NotEnoughArguments, "not enough arguments to bind every parameter",
                    {{"parameters", Value(fn.params.size())}, {"arguments", Value::list(std::move(args))}});
    }

    std::vector<Value> values = std::move(ctx.stack_);
    values.insert(values.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));

    ctx.registers_.clear();
    for (size_t i = 0; i < fn.params.size(); ++i) {
        ctx.registers_[fn.params[i]] = std::move(values[i]);
    }
    ctx.stack_.assign(std::make_move_iterator(values.begin() + fn.params.size()),
                      std::make_move_iterator(values.end()));
}

// Runs the callee on the host stack. Only an explicit Return restores the caller's frame.
inline CallOutcome call_function(VMState& state, const Lookup& target, std::vector<Value> args) {
    Value callee = Interpreter::lookup(state, target);
    const Function& fn = require_function(state, callee, target, "target of call is not executable data");
    if (fn.body.empty()) return {state.ctx.last_result_, false};

    VMState::DepthGuard guard(state);
    CallFrame caller(state.ctx);

    bind_arguments(state, fn, std::move(args));
    state.ctx.install_block(fn.body);

    try {
        Value result = Interpreter::run(state);
        return {std::move(result), false};
    } catch (Signal& signal) {
        if (signal.is_error()) throw;
        caller.restore(state.ctx);
        return {signal.payload(), true};
    }
}

EXPR_HANDLER impl_LOCAL(const Expression& expr, VMState& state) {
    std::vector<Value> args = eval_all(state, expr.operands);
    CallOutcome outcome = call_function(state, expr.target, std::move(args));
    state.ctx.stack_.push_back(outcome.value);
    return std::move(outcome.value);
}

// Replaces the current frame; nothing is saved to come back to.
EXPR_HANDLER impl_GOTO(const Expression& expr, VMState& state) {
    Value callee = Interpreter::lookup(state, expr.target);
    const Function& fn = require_function(state, callee, expr.target, "target of goto is not executable data");
    if (fn.body.empty()) return state.ctx.last_result_;

    std::vector<Value> args = eval_all(state, expr.operands);
    state.ctx.registers_.clear();
    state.ctx.stack_.clear();
    state.ctx.install_block(fn.body);
    bind_arguments(state, fn, std::move(args));
    return state.ctx.last_result_;
}

} // namespace dao::handlers
