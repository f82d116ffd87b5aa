#include <dao/bytecode/instruction.h>
#include <algorithm>

namespace dao {

// --- Lookup ---

Lookup Lookup::value(Value v) {
    Lookup l;
    l.kind = LookupKind::CONST;
    l.constant = std::move(v);
    return l;
}

Lookup Lookup::var(Label name) {
    Lookup l;
    l.kind = LookupKind::VAR;
    l.label = std::move(name);
    return l;
}

Lookup Lookup::deref(Label name) {
    Lookup l;
    l.kind = LookupKind::DEREF;
    l.label = std::move(name);
    return l;
}

Lookup Lookup::qualified(Address module, Label name) {
    Lookup l;
    l.kind = LookupKind::LOOKUP;
    l.module = std::move(module);
    l.label = std::move(name);
    return l;
}

// --- Expression ---

Expression Expression::take(Lookup lookup) {
    Expression e;
    e.op = OpCode::TAKE;
    e.target = std::move(lookup);
    return e;
}

Expression Expression::constant(Value v) {
    return take(Lookup::value(std::move(v)));
}

Expression Expression::unary(OpCode op, Expression operand) {
    Expression e;
    e.op = op;
    e.operands.push_back(std::move(operand));
    return e;
}

Expression Expression::binary(OpCode op, Expression lhs, Expression rhs) {
    Expression e;
    e.op = op;
    e.operands.reserve(2);
    e.operands.push_back(std::move(lhs));
    e.operands.push_back(std::move(rhs));
    return e;
}

Expression Expression::ternary(OpCode op, Expression cond, Expression then_branch, Expression else_branch) {
    Expression e;
    e.op = op;
    e.operands.reserve(3);
    e.operands.push_back(std::move(cond));
    e.operands.push_back(std::move(then_branch));
    e.operands.push_back(std::move(else_branch));
    return e;
}

Expression Expression::sys(Address address, std::vector<Expression> args) {
    Expression e;
    e.op = OpCode::SYS;
    e.address = std::move(address);
    e.operands = std::move(args);
    return e;
}

Expression Expression::sys_forwarding(Address address) {
    Expression e = sys(std::move(address));
    e.forward_stack = true;
    return e;
}

Expression Expression::call(Address module, Lookup target, std::vector<Expression> args) {
    Expression e;
    e.op = OpCode::CALL;
    e.address = std::move(module);
    e.target = std::move(target);
    e.operands = std::move(args);
    return e;
}

Expression Expression::local(Lookup target, std::vector<Expression> args) {
    Expression e;
    e.op = OpCode::LOCAL;
    e.target = std::move(target);
    e.operands = std::move(args);
    return e;
}

Expression Expression::go_to(Lookup target, std::vector<Expression> args) {
    Expression e;
    e.op = OpCode::GOTO;
    e.target = std::move(target);
    e.operands = std::move(args);
    return e;
}

// --- Command ---

namespace {
    Command with_op(CommandOp op) {
        Command c;
        c.op = op;
        return c;
    }

    Command with_lookup(CommandOp op, Lookup lookup) {
        Command c = with_op(op);
        c.lookup = std::move(lookup);
        return c;
    }

    Command with_label(CommandOp op, Label name) {
        Command c = with_op(op);
        c.label = std::move(name);
        return c;
    }
}

Command Command::load(Lookup lookup) { return with_lookup(CommandOp::LOAD, std::move(lookup)); }
Command Command::store(Label name) { return with_label(CommandOp::STORE, std::move(name)); }

Command Command::update(Lookup lookup, Label name) {
    Command c = with_lookup(CommandOp::UPDATE, std::move(lookup));
    c.label = std::move(name);
    return c;
}

Command Command::set_jump(Label name) { return with_label(CommandOp::SETJUMP, std::move(name)); }
Command Command::jump(Label name) { return with_label(CommandOp::JUMP, std::move(name)); }
Command Command::push(Lookup lookup) { return with_lookup(CommandOp::PUSH, std::move(lookup)); }
Command Command::peek() { return with_op(CommandOp::PEEK); }
Command Command::pop() { return with_op(CommandOp::POP); }
Command Command::clear_forward() { return with_op(CommandOp::CLEAR_FORWARD); }
Command Command::clear_reverse() { return with_op(CommandOp::CLEAR_REVERSE); }

Command Command::eval(Expression expr) {
    Command c = with_op(CommandOp::EVAL);
    c.expression = std::move(expr);
    return c;
}

Command Command::perform(Condition cond) {
    Command c = with_op(CommandOp::DO);
    c.condition = std::make_shared<const Condition>(std::move(cond));
    return c;
}

Command Command::when(Lookup test, Command body) {
    return perform(Condition{ConditionKind::WHEN, std::move(test), std::move(body)});
}

Command Command::unless(Lookup test, Command body) {
    return perform(Condition{ConditionKind::UNLESS, std::move(test), std::move(body)});
}

Command Command::return_value(Lookup lookup) { return with_lookup(CommandOp::RETURN, std::move(lookup)); }
Command Command::throw_value(Lookup lookup) { return with_lookup(CommandOp::THROW, std::move(lookup)); }

std::strong_ordering Command::operator<=>(const Command& other) const {
    if (auto c = op <=> other.op; c != 0) return c;
    if (auto c = lookup <=> other.lookup; c != 0) return c;
    if (auto c = label <=> other.label; c != 0) return c;
    if (auto c = expression <=> other.expression; c != 0) return c;

    if (condition == other.condition) return std::strong_ordering::equal;
    if (!condition) return std::strong_ordering::less;
    if (!other.condition) return std::strong_ordering::greater;
    return *condition <=> *other.condition;
}

bool Command::operator==(const Command& other) const {
    return (*this <=> other) == 0;
}

// --- Block ---

Block::Block(std::vector<Command> code) {
    if (!code.empty()) code_ = std::make_shared<const std::vector<Command>>(std::move(code));
}

std::span<const Command> Block::commands() const noexcept {
    if (!code_) return {};
    return std::span<const Command>(*code_);
}

std::strong_ordering Block::operator<=>(const Block& other) const {
    if (code_ == other.code_) return std::strong_ordering::equal;
    auto a = commands();
    auto b = other.commands();
    return std::lexicographical_compare_three_way(a.begin(), a.end(), b.begin(), b.end());
}

bool Block::operator==(const Block& other) const {
    return (*this <=> other) == 0;
}

}
