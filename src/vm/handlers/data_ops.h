#pragma once
#include "vm/handlers/utils.h"

namespace dao::handlers {

// --- Lookups ---

LOOKUP_HANDLER impl_RESULT(const Lookup&, VMState& state) {
    return state.ctx.last_result_;
}

LOOKUP_HANDLER impl_CONST(const Lookup& lookup, VMState&) {
    return lookup.constant;
}

LOOKUP_HANDLER impl_VAR(const Lookup& lookup, VMState& state) {
    const Label& name = require_label(state, lookup);
    const Value* value = state.ctx.registers_.find(name);
    if (!value) [[unlikely]] {
        state.error(ErrorKind::UndefinedVariable, "no register with this name",
                    {{"variable", Value(name.str())}});
    }
    return *value;
}

// Private namespace shadows the public one.
LOOKUP_HANDLER impl_DEREF(const Lookup& lookup, VMState& state) {
    const Label& name = require_label(state, lookup);
    const auto& module = state.ctx.current_module_;
    if (module) {
        if (const Value* value = module->find_private(name)) return *value;
        if (const Value* value = module->find_public(name)) return *value;
    }
    state.error(ErrorKind::UndefinedModuleVariable, "variable is not defined in the current module",
                {{"variable", Value(name.str())}});
}

LOOKUP_HANDLER impl_LOOKUP(const Lookup& lookup, VMState& state) {
    const Address& address = require_module(state, lookup);
    const Label& name = require_label(state, lookup);
    const LoadedModule& loaded = state.modules.lookup(address);
    const Value* value = loaded.module.find_public(name);
    if (!value) [[unlikely]] {
        state.error(ErrorKind::UndefinedModuleVariable, "module does not export this variable",
                    {{"module", Value(address)}, {"variable", Value(name.str())}});
    }
    return *value;
}

// --- Register commands ---

COMMAND_HANDLER impl_LOAD(const Command& cmd, VMState& state) {
    state.ctx.last_result_ = Interpreter::lookup(state, cmd.lookup);
}

COMMAND_HANDLER impl_STORE(const Command& cmd, VMState& state) {
    const Label& name = require_label(state, cmd);
    state.ctx.registers_[name] = state.ctx.last_result_;
}

// Writes an existing private variable; the previous value becomes the result.
COMMAND_HANDLER impl_UPDATE(const Command& cmd, VMState& state) {
    const Label& name = require_label(state, cmd);
    auto& module = state.ctx.current_module_;
    if (!module) [[unlikely]] {
        state.error(ErrorKind::NoCurrentModule, "update occurred with no current module",
                    {{"instruction", instruction_text(cmd)}});
    }
    Value* slot = module->private_defs.find(name);
    if (!slot) [[unlikely]] {
        state.error(ErrorKind::UndefinedVariable, "module has no private variable with this name",
                    {{"variable", Value(name.str())}});
    }
    Value updated = Interpreter::lookup(state, cmd.lookup);
    state.ctx.last_result_ = std::exchange(*slot, std::move(updated));
}

} // namespace dao::handlers
