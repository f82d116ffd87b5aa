#include "module/module_manager.h"
#include <dao/signal.h>
#include <dao/bytecode/instruction.h>

namespace dao {

// public[method] of a builtin: forward the caller's stack to the system call, then return.
static Value make_forwarder(const Address& syscall) {
    Block body{
        Command::eval(Expression::sys_forwarding(syscall)),
        Command::return_value(Lookup::result()),
    };
    return Value::function({}, std::move(body));
}

void ModuleManager::ensure_free(const Address& address) const {
    if (modules_.contains(address)) [[unlikely]] {
        throw_error(ErrorKind::ModuleAlreadyActive, "a module is already active at this address",
                    {{"address", Value(address)}});
    }
}

void ModuleManager::install_builtin(const Address& address, NativeModule native) {
    ensure_free(address);

    Module module;
    module.private_defs = std::move(native.data);
    module.rules = std::move(native.rules);

    const auto& names = native.methods.keys();
    native_t* fns = native.methods.data_values();
    for (size_t i = 0; i < names.size(); ++i) {
        Address syscall = address.child(names[i]);
        module.set_public(names[i], make_forwarder(syscall));
        system_calls_.insert_or_assign(syscall, std::move(fns[i]));
    }

    modules_.insert(address, LoadedModule::builtin(std::move(module), std::move(native.evaluator)));
}

void ModuleManager::activate(const Address& address, Module module) {
    ensure_free(address);
    modules_.insert(address, LoadedModule::plain(std::move(module)));
}

void ModuleManager::deactivate(const Address& address) {
    modules_.erase(address);
    system_calls_.erase_branch(address);
}

const LoadedModule& ModuleManager::lookup(const Address& address) const {
    const LoadedModule* loaded = modules_.find(address);
    if (!loaded) [[unlikely]] {
        throw_error(ErrorKind::UndefinedModule, "no module is loaded at this address",
                    {{"module", Value(address)}});
    }
    return *loaded;
}

const evaluator_t* ModuleManager::find_evaluator(const Address& tag) const noexcept {
    const LoadedModule* loaded = modules_.find(tag);
    if (!loaded || !loaded->has_evaluator()) return nullptr;
    return &loaded->evaluator;
}

std::vector<Module> ModuleManager::all_modules() const {
    std::vector<Module> out;
    modules_.for_each([&out](const Address&, const LoadedModule& loaded) { out.push_back(loaded.module); });
    return out;
}

}
