#pragma once

#include <optional>
#include <vector>
#include <dao/runtime.h>
#include <dao/value.h>
#include <dao/bytecode/instruction.h>
#include <dao/core/module.h>

namespace dao {

struct ExecutionContext {
    uint64_t eval_counter_ = 0;
    Value last_result_;

    // --- Current frame ---
    Registers registers_;
    JumpTable jumps_;
    std::vector<Value> stack_;  // back() is the top
    Block block_;
    size_t pc_ = 0;

    std::optional<Module> current_module_;

    // Host recursion depth of nested calls.
    size_t depth_ = 0;

    inline void reset() noexcept {
        eval_counter_ = 0;
        last_result_ = Value();
        registers_.clear();
        jumps_.clear();
        stack_.clear();
        block_ = Block();
        pc_ = 0;
        current_module_.reset();
        depth_ = 0;
    }

    [[gnu::always_inline]]
    inline bool in_range() const noexcept { return block_.contains(pc_); }

    // Every SETJUMP in the block becomes a jump target at its own index.
    inline void install_block(Block block) {
        jumps_.clear();
        for (size_t i = 0; i < block.size(); ++i) {
            const Command& cmd = block[i];
            if (cmd.op == CommandOp::SETJUMP && cmd.label) jumps_[*cmd.label] = i;
        }
        block_ = std::move(block);
        pc_ = 0;
    }
};

}
