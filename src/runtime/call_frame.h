#pragma once

#include <optional>
#include <utility>
#include <vector>
#include "runtime/execution_context.h"

namespace dao {

// Caller state saved across a call; restored only when the callee returns explicitly.
struct CallFrame {
    Registers registers_;
    JumpTable jumps_;
    std::vector<Value> stack_;
    Block block_;
    size_t pc_ = 0;

    CallFrame() = default;

    explicit CallFrame(const ExecutionContext& ctx)
        : registers_(ctx.registers_), jumps_(ctx.jumps_), stack_(ctx.stack_), block_(ctx.block_), pc_(ctx.pc_) {
    }

    inline void restore(ExecutionContext& ctx) noexcept {
        ctx.registers_ = std::move(registers_);
        ctx.jumps_ = std::move(jumps_);
        ctx.stack_ = std::move(stack_);
        ctx.block_ = std::move(block_);
        ctx.pc_ = pc_;
    }
};

}
