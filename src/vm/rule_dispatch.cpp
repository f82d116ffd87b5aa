#include "vm/rule_dispatch.h"
#include "vm/interpreter.h"
#include "runtime/execution_context.h"
#include <utility>

namespace dao {

namespace {

// Stack the action sees: the unmatched tokens, first token on top.
std::vector<Value> remainder_stack(std::span<const std::string> tokens, size_t matched) {
    std::vector<Value> stack;
    stack.reserve(tokens.size() - matched);
    for (size_t i = tokens.size(); i > matched; --i) stack.emplace_back(tokens[i - 1]);
    return stack;
}

struct StackSwap {
    ExecutionContext& ctx;
    std::vector<Value> saved;

    StackSwap(ExecutionContext& context, std::vector<Value> replacement)
        : ctx(context), saved(std::exchange(context.stack_, std::move(replacement))) {}
    ~StackSwap() { ctx.stack_ = std::move(saved); }
};

} // namespace

void run_rules(VMState& state, std::span<const std::string> tokens, const Module& module) {
    auto& ctx = state.ctx;
    ctx.current_module_ = module;
    for (const Rule& rule : module.rules) {
        if (!rule.matches(tokens)) continue;

        StackSwap swap(ctx, remainder_stack(tokens, rule.pattern.size()));
        ctx.install_block(rule.action);
        try {
            Interpreter::run(state);
        } catch (const Signal& signal) {
            if (signal.is_error()) throw;
            ctx.last_result_ = signal.payload();
        }
    }
}

}
