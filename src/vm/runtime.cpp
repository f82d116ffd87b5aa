#include <dao/runtime.h>
#include <dao/bytecode/disassemble.h>
#include "vm/interpreter.h"
#include "vm/rule_dispatch.h"
#include "vm/vm_state.h"
#include "module/module_manager.h"
#include "runtime/execution_context.h"
#include <format>
#include <print>
#include <cstdio>
#include <iterator>
#include <type_traits>

namespace dao {

Runtime::Runtime(RuntimeConfig config)
    : config_(config), context_(std::make_unique<ExecutionContext>()), modules_(std::make_unique<ModuleManager>()) {
}

Runtime::~Runtime() noexcept = default;

// Host boundary: a Return ends the evaluation normally, an Error becomes a Failure.
template <typename Fn>
auto Runtime::guarded(Fn&& body) {
    using result_t = std::decay_t<std::invoke_result_t<Fn, VMState&>>;
    VMState state{*this, *context_, *modules_, config_};
    try {
        return Outcome<result_t>(body(state));
    } catch (const Signal& signal) {
        if constexpr (std::is_same_v<result_t, Value>) {
            if (signal.is_return()) return Outcome<result_t>(signal.payload());
        }
        Failure failure{signal.payload()};
        if (config_.report_errors) report(failure);
        return Outcome<result_t>(meow::unexpected(std::move(failure)));
    }
}

void Runtime::report(const Failure& failure) const {
    std::println(stderr, "Runtime Error: {}", to_string(failure.error));
    const Block& block = context_->block_;
    if (block.empty()) return;
    const size_t pc = context_->pc_ > 0 ? context_->pc_ - 1 : 0;
    std::println(stderr, "{}", disassemble_around(block, pc, config_.disassembly_context));
}

// --- Installation ---

Outcome<Address> Runtime::install_module(const Address& address, NativeModule module) {
    return guarded([&](VMState& state) {
        state.modules.install_builtin(address, std::move(module));
        return address;
    });
}

void Runtime::install_system_call(const Address& address, native_t fn) {
    modules_->install_system_call(address, std::move(fn));
}

Outcome<Address> Runtime::activate_module(const Address& address, Module module) {
    return guarded([&](VMState& state) {
        state.modules.activate(address, std::move(module));
        return address;
    });
}

void Runtime::deactivate_module(const Address& address) {
    modules_->deactivate(address);
}

// --- Module selection ---

Outcome<Module> Runtime::lookup_module(const Address& address) const {
    if (const LoadedModule* loaded = modules_->find(address)) return loaded->module;
    return meow::unexpected(Failure{make_error(ErrorKind::UndefinedModule, "no module is loaded at this address",
                                               {{"module", Value(address)}})});
}

std::vector<Module> Runtime::select_modules(std::span<const std::string> queries) const {
    std::vector<Module> out;
    for (const std::string& query : queries) {
        auto address = Address::parse(query);
        if (!address) {
            std::println(stderr, "(select_module) {}", address.error().message());
            continue;
        }
        const LoadedModule* loaded = modules_->find(*address);
        if (!loaded) {
            std::println(stderr, "(select_module) no module is loaded at {}", address->to_string());
            continue;
        }
        out.push_back(loaded->module);
    }
    return out;
}

std::vector<Module> Runtime::select_all_modules() const {
    return modules_->all_modules();
}

// --- Execution ---

Outcome<Value> Runtime::dispatch(std::span<const std::string> tokens, std::span<const Module> modules) {
    return guarded([&](VMState& state) {
        for (const Module& module : modules) run_rules(state, tokens, module);
        return state.ctx.last_result_;
    });
}

Outcome<Value> Runtime::dispatch(std::span<const std::string> tokens, const Module& module) {
    return dispatch(tokens, std::span<const Module>(&module, 1));
}

Outcome<Value> Runtime::evaluate(const Block& block) {
    return guarded([&](VMState& state) {
        state.ctx.install_block(block);
        return Interpreter::run(state);
    });
}

Outcome<Value> Runtime::evaluate(const Command& command) {
    return guarded([&](VMState& state) {
        Interpreter::step(state, command);
        return state.ctx.last_result_;
    });
}

Outcome<Value> Runtime::evaluate(const Expression& expression) {
    return guarded([&](VMState& state) {
        state.ctx.last_result_ = Interpreter::eval(state, expression);
        return state.ctx.last_result_;
    });
}

Outcome<Value> Runtime::evaluate(const Lookup& lookup) {
    return guarded([&](VMState& state) { return Interpreter::lookup(state, lookup); });
}

// --- State ---

const Value& Runtime::last_result() const noexcept { return context_->last_result_; }
void Runtime::set_last_result(Value value) noexcept { context_->last_result_ = std::move(value); }

const Registers& Runtime::registers() const noexcept { return context_->registers_; }
void Runtime::set_register(Label name, Value value) { context_->registers_[std::move(name)] = std::move(value); }

std::span<const Value> Runtime::stack() const noexcept { return context_->stack_; }

void Runtime::push(Value value) { context_->stack_.push_back(std::move(value)); }

Value Runtime::pop() {
    auto& stack = context_->stack_;
    if (stack.empty()) [[unlikely]] throw_error(ErrorKind::StackUnderflow, "stack is empty");
    Value top = std::move(stack.back());
    stack.pop_back();
    return top;
}

const Value& Runtime::peek() const {
    const auto& stack = context_->stack_;
    if (stack.empty()) [[unlikely]] throw_error(ErrorKind::StackUnderflow, "stack is empty");
    return stack.back();
}

const std::optional<Module>& Runtime::current_module() const noexcept { return context_->current_module_; }
void Runtime::set_current_module(std::optional<Module> module) { context_->current_module_ = std::move(module); }

const JumpTable& Runtime::jump_table() const noexcept { return context_->jumps_; }
const Block& Runtime::current_block() const noexcept { return context_->block_; }
size_t Runtime::program_counter() const noexcept { return context_->pc_; }
uint64_t Runtime::eval_counter() const noexcept { return context_->eval_counter_; }
size_t Runtime::call_depth() const noexcept { return context_->depth_; }

// --- Introspection ---

std::vector<Address> Runtime::loaded_module_addresses() const { return modules_->module_addresses(); }
std::vector<Address> Runtime::system_call_addresses() const { return modules_->system_call_addresses(); }

std::string Runtime::dump_state() const {
    const auto& ctx = *context_;
    std::string out = disassemble_block(ctx.block_, "current block");
    std::format_to(std::back_inserter(out), "pc = {}\nevalCounter = {}\nlastResult = {}\n",
                   ctx.pc_, ctx.eval_counter_, to_string(ctx.last_result_));

    out += "registers:\n";
    const auto& names = ctx.registers_.keys();
    const auto& values = ctx.registers_.values();
    for (size_t i = 0; i < names.size(); ++i) {
        std::format_to(std::back_inserter(out), "  {} = {}\n", names[i].str(), to_string(values[i]));
    }

    out += "jumps:\n";
    const auto& targets = ctx.jumps_.keys();
    const auto& offsets = ctx.jumps_.values();
    for (size_t i = 0; i < targets.size(); ++i) {
        std::format_to(std::back_inserter(out), "  {} -> {:04d}\n", targets[i].str(), offsets[i]);
    }

    out += "stack (bottom to top):\n";
    for (const Value& value : ctx.stack_) {
        std::format_to(std::back_inserter(out), "  {}\n", to_string(value));
    }
    return out;
}

}
