#pragma once

#include <string_view>
#include <dao/config.h>
#include <dao/runtime.h>
#include <dao/signal.h>
#include "runtime/execution_context.h"
#include "runtime/call_frame.h"

namespace dao {
class ModuleManager;
}

namespace dao {

struct VMState {
    Runtime& runtime;
    ExecutionContext& ctx;
    ModuleManager& modules;
    const RuntimeConfig& config;

    [[noreturn]] void error(ErrorKind kind, std::string_view problem, ErrorContext context = {}) const {
        throw_error(kind, problem, context);
    }

    // Keeps the host stack bounded; released on scope exit.
    struct DepthGuard {
        ExecutionContext& ctx;
        explicit DepthGuard(VMState& state) : ctx(state.ctx) {
            if (ctx.depth_ >= state.config.max_call_depth) [[unlikely]] {
                state.error(ErrorKind::CallDepthExceeded, "call nesting exceeds the configured limit",
                            {{"limit", Value(state.config.max_call_depth)}});
            }
            ++ctx.depth_;
        }
        ~DepthGuard() { --ctx.depth_; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;
    };
};

}
