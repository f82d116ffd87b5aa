#pragma once

#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <dao/common.h>
#include <dao/config.h>
#include <dao/naming.h>
#include <dao/signal.h>
#include <dao/value.h>
#include <dao/bytecode/instruction.h>
#include <dao/core/module.h>
#include "meow_expected.h"
#include "meow_flat_map.h"

namespace dao {
struct ExecutionContext;
class ModuleManager;
}

namespace dao {

using Registers = meow::flat_map<Label, Value>;
using JumpTable = meow::flat_map<Label, size_t>;

template <typename T>
using Outcome = meow::expected<T, Failure>;

class Runtime {
public:
    // --- Constructors ---
    explicit Runtime(RuntimeConfig config = {});
    Runtime(const Runtime&) = delete;
    Runtime(Runtime&&) = delete;
    Runtime& operator=(const Runtime&) = delete;
    Runtime& operator=(Runtime&&) = delete;
    ~Runtime() noexcept;

    // --- Installation ---

    // Registers `address.method` system calls and a forwarding public Func per method.
    Outcome<Address> install_module(const Address& address, NativeModule module);
    void install_system_call(const Address& address, native_t fn);

    Outcome<Address> activate_module(const Address& address, Module module);
    void deactivate_module(const Address& address);

    // --- Module selection ---
    [[nodiscard]] Outcome<Module> lookup_module(const Address& address) const;
    [[nodiscard]] std::vector<Module> select_modules(std::span<const std::string> queries) const;
    [[nodiscard]] std::vector<Module> select_all_modules() const;

    // --- Execution ---

    // Runs every matching rule of each module against the tokens.
    Outcome<Value> dispatch(std::span<const std::string> tokens, std::span<const Module> modules);
    Outcome<Value> dispatch(std::span<const std::string> tokens, const Module& module);

    // Installs the block as the current code (pc 0, fresh jump table) and runs it.
    Outcome<Value> evaluate(const Block& block);
    Outcome<Value> evaluate(const Command& command);
    Outcome<Value> evaluate(const Expression& expression);
    Outcome<Value> evaluate(const Lookup& lookup);

    // --- State (natives observe and extend the calling convention through these) ---
    [[nodiscard]] const Value& last_result() const noexcept;
    void set_last_result(Value value) noexcept;

    [[nodiscard]] const Registers& registers() const noexcept;
    void set_register(Label name, Value value);

    [[nodiscard]] std::span<const Value> stack() const noexcept;
    void push(Value value);
    // Throws a StackUnderflow error signal on an empty stack.
    Value pop();
    [[nodiscard]] const Value& peek() const;

    [[nodiscard]] const std::optional<Module>& current_module() const noexcept;
    void set_current_module(std::optional<Module> module);

    [[nodiscard]] const JumpTable& jump_table() const noexcept;
    [[nodiscard]] const Block& current_block() const noexcept;
    [[nodiscard]] size_t program_counter() const noexcept;
    [[nodiscard]] uint64_t eval_counter() const noexcept;
    [[nodiscard]] size_t call_depth() const noexcept;

    // --- Introspection ---
    [[nodiscard]] std::vector<Address> loaded_module_addresses() const;
    [[nodiscard]] std::vector<Address> system_call_addresses() const;
    [[nodiscard]] std::string dump_state() const;

    [[nodiscard]] inline const RuntimeConfig& config() const noexcept { return config_; }

private:
    RuntimeConfig config_;

    // --- Subsystems ---
    std::unique_ptr<ExecutionContext> context_;
    std::unique_ptr<ModuleManager> modules_;

    // --- Execution internals ---
    template <typename Fn>
    auto guarded(Fn&& body);
    void report(const Failure& failure) const;
};

// `print` and `error` system calls writing to stdout and stderr.
void install_basic_io(Runtime& runtime);

}
