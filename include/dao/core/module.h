#pragma once

#include <string>
#include <vector>
#include <dao/common.h>
#include <dao/naming.h>
#include <dao/value.h>
#include <dao/bytecode/instruction.h>
#include "meow_flat_map.h"

namespace dao {

using Defines = meow::flat_map<Label, Value>;

struct Rule {
    std::vector<std::string> pattern;
    Block action;

    // True when the pattern is a prefix of the input tokens.
    [[nodiscard]] bool matches(std::span<const std::string> input) const noexcept;
};

struct Module {
    std::vector<Address> imports;
    Defines private_defs;
    Defines public_defs;
    std::vector<Rule> rules;

    [[nodiscard]] inline const Value* find_private(const Label& name) const noexcept { return private_defs.find(name); }
    [[nodiscard]] inline const Value* find_public(const Label& name) const noexcept { return public_defs.find(name); }

    inline void set_private(Label name, Value value) { private_defs[std::move(name)] = std::move(value); }
    inline void set_public(Label name, Value value) { public_defs[std::move(name)] = std::move(value); }
};

// Host-declared module: natives become system calls under the module's address.
struct NativeModule {
    meow::flat_map<Label, native_t> methods;
    Defines data;
    std::vector<Rule> rules;
    evaluator_t evaluator;

    inline NativeModule& method(Label name, native_t fn) {
        methods[std::move(name)] = std::move(fn);
        return *this;
    }
    inline NativeModule& define(Label name, Value value) {
        data[std::move(name)] = std::move(value);
        return *this;
    }
    inline NativeModule& rule(Rule r) {
        rules.push_back(std::move(r));
        return *this;
    }
};

struct LoadedModule {
    enum class Kind : uint8_t { PLAIN, BUILTIN };

    Kind kind = Kind::PLAIN;
    Module module;
    evaluator_t evaluator;  // BUILTIN only, may be empty

    [[nodiscard]] static LoadedModule plain(Module module) {
        return LoadedModule{Kind::PLAIN, std::move(module), {}};
    }
    [[nodiscard]] static LoadedModule builtin(Module module, evaluator_t evaluator) {
        return LoadedModule{Kind::BUILTIN, std::move(module), std::move(evaluator)};
    }

    [[nodiscard]] inline bool is_builtin() const noexcept { return kind == Kind::BUILTIN; }
    [[nodiscard]] inline bool has_evaluator() const noexcept { return is_builtin() && static_cast<bool>(evaluator); }
};

}
