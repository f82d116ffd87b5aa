#pragma once

#include <vector>
#include <dao/common.h>
#include <dao/naming.h>
#include <dao/core/module.h>
#include <dao/core/prefix_trie.h>

namespace dao {

// Owns the loaded-module trie and the system-call trie of one Runtime.
class ModuleManager {
public:
    ModuleManager() = default;
    ModuleManager(const ModuleManager&) = delete;
    ModuleManager(ModuleManager&&) = default;
    ModuleManager& operator=(const ModuleManager&) = delete;
    ModuleManager& operator=(ModuleManager&&) = default;

    // --- Installation (these throw ModuleAlreadyActive) ---
    void install_builtin(const Address& address, NativeModule native);
    void activate(const Address& address, Module module);
    void deactivate(const Address& address);

    inline void install_system_call(const Address& address, native_t fn) {
        system_calls_.insert_or_assign(address, std::move(fn));
    }

    // --- Resolution ---

    // Throws UndefinedModule.
    [[nodiscard]] const LoadedModule& lookup(const Address& address) const;

    [[nodiscard]] inline const LoadedModule* find(const Address& address) const noexcept {
        return modules_.find(address);
    }

    [[nodiscard]] inline const native_t* find_system_call(const Address& address) const noexcept {
        return system_calls_.find(address);
    }

    // Operator evaluator of the builtin module sitting at a Data tag, if any.
    [[nodiscard]] const evaluator_t* find_evaluator(const Address& tag) const noexcept;

    // --- Introspection ---
    [[nodiscard]] inline std::vector<Address> module_addresses() const { return modules_.addresses(); }
    [[nodiscard]] inline std::vector<Address> system_call_addresses() const { return system_calls_.addresses(); }
    [[nodiscard]] std::vector<Module> all_modules() const;

    inline void reset() noexcept {
        modules_.clear();
        system_calls_.clear();
    }
private:
    PrefixTrie<LoadedModule> modules_;
    PrefixTrie<native_t> system_calls_;

    void ensure_free(const Address& address) const;
};

}
