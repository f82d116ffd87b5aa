#pragma once
#include "vm/handlers/utils.h"
#include "vm/handlers/flow_ops.h"

namespace dao::handlers {

// Puts the saved stack back however the native exits.
struct StackRestore {
    ExecutionContext& ctx;
    std::vector<Value> saved;

    ~StackRestore() { ctx.stack_ = std::move(saved); }
};

EXPR_HANDLER impl_SYS(const Expression& expr, VMState& state) {
    const Address& address = require_address(state, expr);
    const native_t* found = state.modules.find_system_call(address);
    if (!found) [[unlikely]] {
        state.error(ErrorKind::UndefinedSystemCall, "no system call at this address",
                    {{"address", Value(address)}});
    }
    native_t native = *found;

    Value result;
    {
        StackRestore restore{state.ctx, state.ctx.stack_};
        std::vector<Value> args = eval_all(state, expr.operands);
        // A forwarding call hands the native the caller's stack untouched.
        if (!expr.forward_stack) state.ctx.stack_ = std::move(args);

        VMState::DepthGuard guard(state);
        try {
            result = native(state.runtime);
        } catch (const Signal& signal) {
            if (signal.is_error()) {
                state.error(ErrorKind::SystemCall, "system call raised an error",
                            {{"address", Value(address)}, {"exception", signal.payload()}});
            }
            result = signal.payload();
        }
    }

    state.ctx.last_result_ = result;
    return result;
}

// Cross-module call. The callee runs with the target module current.
EXPR_HANDLER impl_CALL(const Expression& expr, VMState& state) {
    auto& ctx = state.ctx;
    Value caller_result = ctx.last_result_;
    Module target = state.modules.lookup(require_address(state, expr)).module;
    std::optional<Module> caller_module = ctx.current_module_;

    std::vector<Value> args = eval_all(state, expr.operands);
    ctx.current_module_ = std::move(target);
    ctx.last_result_ = std::move(caller_result);

    CallOutcome outcome = call_function(state, expr.target, std::move(args));
    if (outcome.returned) ctx.current_module_ = std::move(caller_module);
    return std::move(outcome.value);
}

} // namespace dao::handlers
