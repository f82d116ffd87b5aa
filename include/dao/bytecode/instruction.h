#pragma once

#include <compare>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <vector>
#include <dao/naming.h>
#include <dao/value.h>
#include <dao/bytecode/op_codes.h>

namespace dao {

struct Lookup {
    LookupKind kind = LookupKind::RESULT;
    Value constant;                 // CONST
    std::optional<Label> label;     // VAR, DEREF, LOOKUP
    std::optional<Address> module;  // LOOKUP

    [[nodiscard]] static Lookup result() { return {}; }
    [[nodiscard]] static Lookup value(Value v);
    [[nodiscard]] static Lookup var(Label name);
    [[nodiscard]] static Lookup deref(Label name);
    [[nodiscard]] static Lookup qualified(Address module, Label name);

    std::strong_ordering operator<=>(const Lookup&) const = default;
    bool operator==(const Lookup&) const = default;
};

struct Expression {
    OpCode op = OpCode::TAKE;
    Lookup target;                    // TAKE, CALL, LOCAL, GOTO
    std::optional<Address> address;   // SYS, CALL
    std::vector<Expression> operands; // operator operands, or call arguments
    bool forward_stack = false;       // SYS: keep the caller's stack instead of the arguments

    [[nodiscard]] static Expression take(Lookup lookup);
    [[nodiscard]] static Expression constant(Value v);
    [[nodiscard]] static Expression unary(OpCode op, Expression operand);
    [[nodiscard]] static Expression binary(OpCode op, Expression lhs, Expression rhs);
    [[nodiscard]] static Expression ternary(OpCode op, Expression cond, Expression then_branch, Expression else_branch);
    [[nodiscard]] static Expression sys(Address address, std::vector<Expression> args = {});
    [[nodiscard]] static Expression sys_forwarding(Address address);
    [[nodiscard]] static Expression call(Address module, Lookup target, std::vector<Expression> args = {});
    [[nodiscard]] static Expression local(Lookup target, std::vector<Expression> args = {});
    [[nodiscard]] static Expression go_to(Lookup target, std::vector<Expression> args = {});

    std::strong_ordering operator<=>(const Expression&) const = default;
    bool operator==(const Expression&) const = default;
};

struct Condition;

struct Command {
    CommandOp op = CommandOp::LOAD;
    Lookup lookup;                               // LOAD, UPDATE, PUSH, RETURN, THROW
    std::optional<Label> label;                  // STORE, UPDATE, SETJUMP, JUMP
    std::optional<Expression> expression;        // EVAL
    std::shared_ptr<const Condition> condition;  // DO

    // --- Factories ---
    [[nodiscard]] static Command load(Lookup lookup);
    [[nodiscard]] static Command store(Label name);
    [[nodiscard]] static Command update(Lookup lookup, Label name);
    [[nodiscard]] static Command set_jump(Label name);
    [[nodiscard]] static Command jump(Label name);
    [[nodiscard]] static Command push(Lookup lookup);
    [[nodiscard]] static Command peek();
    [[nodiscard]] static Command pop();
    [[nodiscard]] static Command clear_forward();
    [[nodiscard]] static Command clear_reverse();
    [[nodiscard]] static Command eval(Expression expr);
    [[nodiscard]] static Command perform(Condition cond);
    [[nodiscard]] static Command when(Lookup test, Command body);
    [[nodiscard]] static Command unless(Lookup test, Command body);
    [[nodiscard]] static Command return_value(Lookup lookup);
    [[nodiscard]] static Command throw_value(Lookup lookup);

    std::strong_ordering operator<=>(const Command& other) const;
    bool operator==(const Command& other) const;
};

struct Condition {
    ConditionKind kind = ConditionKind::WHEN;
    Lookup test;
    Command body;

    std::strong_ordering operator<=>(const Condition&) const = default;
    bool operator==(const Condition&) const = default;
};

// Immutable, shared instruction array.
class Block {
public:
    Block() = default;
    Block(std::vector<Command> code);
    Block(std::initializer_list<Command> code) : Block(std::vector<Command>(code)) {}

    [[nodiscard]] inline size_t size() const noexcept { return code_ ? code_->size() : 0; }
    [[nodiscard]] inline bool empty() const noexcept { return size() == 0; }
    [[nodiscard]] inline bool contains(size_t pc) const noexcept { return pc < size(); }
    [[nodiscard]] inline const Command& operator[](size_t pc) const noexcept { return (*code_)[pc]; }
    [[nodiscard]] std::span<const Command> commands() const noexcept;

    std::strong_ordering operator<=>(const Block& other) const;
    bool operator==(const Block& other) const;
private:
    std::shared_ptr<const std::vector<Command>> code_;
};

struct Function {
    std::vector<Label> params;
    Block body;

    std::strong_ordering operator<=>(const Function&) const = default;
    bool operator==(const Function&) const = default;
};

}
