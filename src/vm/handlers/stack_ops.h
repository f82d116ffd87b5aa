#pragma once
#include "vm/handlers/utils.h"
#include <algorithm>

namespace dao::handlers {

[[gnu::always_inline]]
inline void require_stack(VMState& state, const Command& cmd) {
    if (state.ctx.stack_.empty()) [[unlikely]] {
        state.error(ErrorKind::StackUnderflow, "stack is empty",
                    {{"instruction", instruction_text(cmd)}});
    }
}

COMMAND_HANDLER impl_PUSH(const Command& cmd, VMState& state) {
    state.ctx.stack_.push_back(Interpreter::lookup(state, cmd.lookup));
}

COMMAND_HANDLER impl_PEEK(const Command& cmd, VMState& state) {
    require_stack(state, cmd);
    state.ctx.last_result_ = state.ctx.stack_.back();
}

COMMAND_HANDLER impl_POP(const Command& cmd, VMState& state) {
    require_stack(state, cmd);
    state.ctx.last_result_ = std::move(state.ctx.stack_.back());
    state.ctx.stack_.pop_back();
}

// Oldest entry first.
COMMAND_HANDLER impl_CLEAR_FORWARD(const Command&, VMState& state) {
    std::vector<Value> items = std::move(state.ctx.stack_);
    state.ctx.stack_.clear();
    state.ctx.last_result_ = Value::list(std::move(items));
}

// Top of the stack first.
COMMAND_HANDLER impl_CLEAR_REVERSE(const Command&, VMState& state) {
    std::vector<Value> items = std::move(state.ctx.stack_);
    state.ctx.stack_.clear();
    std::reverse(items.begin(), items.end());
    state.ctx.last_result_ = Value::list(std::move(items));
}

} // namespace dao::handlers
