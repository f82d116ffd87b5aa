#include "check.h"
#include <dao/runtime.h>
#include <dao/bytecode/instruction.h>
#include <algorithm>

using namespace dao;

namespace {
    RuntimeConfig quiet() {
        RuntimeConfig config;
        config.report_errors = false;
        return config;
    }

    Expression k(Value v) { return Expression::constant(std::move(v)); }
    Expression var(const char* name) { return Expression::take(Lookup::var(Label(name))); }
    Expression bin(OpCode op, Expression a, Expression b) { return Expression::binary(op, std::move(a), std::move(b)); }
    Lookup kv(Value v) { return Lookup::value(std::move(v)); }

    // Starts from an empty stack so earlier runs do not feed arguments.
    std::vector<Command> program() {
        return {Command::clear_forward()};
    }

    // Puts a value in a caller register.
    void define(std::vector<Command>& code, const char* name, Value value) {
        code.push_back(Command::load(kv(std::move(value))));
        code.push_back(Command::store(Label(name)));
    }
}

static void test_binding_and_leftovers() {
    check::section("binding and leftovers");
    Runtime rt(quiet());

    std::vector<Value> seen_stack;
    Registers seen_registers;
    rt.install_system_call(Address("test.probe"), [&](Runtime& r) {
        seen_stack.assign(r.stack().begin(), r.stack().end());
        seen_registers = r.registers();
        return Value();
    });

    // The leftover value is moved into a register so the probe can see it.
    Value add = Value::function({Label("a"), Label("b")}, Block{
        Command::pop(),
        Command::store(Label("extra")),
        Command::eval(Expression::sys(Address("test.probe"))),
        Command::eval(bin(OpCode::ADD, var("a"), var("b"))),
        Command::return_value(Lookup::result()),
    });

    std::vector<Command> code;
    define(code, "add", add);
    code.push_back(Command::push(kv(Value(1))));
    code.push_back(Command::push(kv(Value(2))));
    code.push_back(Command::push(kv(Value(3))));
    code.push_back(Command::eval(Expression::local(Lookup::var(Label("add")))));
    code.push_back(Command::store(Label("sum")));

    auto out = rt.evaluate(Block(code));
    CHECK_OK(out);
    if (out) CHECK(*out == Value(3));

    // Inside the callee: parameters bound oldest first, the extra value left for the body to pop.
    CHECK(seen_stack.empty());
    CHECK(seen_registers.find(Label("extra")) && *seen_registers.find(Label("extra")) == Value(3));
    CHECK(seen_registers.find(Label("a")) && *seen_registers.find(Label("a")) == Value(1));
    CHECK(seen_registers.find(Label("b")) && *seen_registers.find(Label("b")) == Value(2));
    CHECK(seen_registers.find(Label("add")) == nullptr);

    // Back in the caller: frame restored, result pushed.
    std::vector<Value> expected{Value(1), Value(2), Value(3), Value(3)};
    CHECK(std::ranges::equal(rt.stack(), expected));
    CHECK(rt.registers().find(Label("add")) != nullptr);
    CHECK(rt.registers().find(Label("sum")) != nullptr);
    CHECK(rt.registers().find(Label("a")) == nullptr);
}

static void test_explicit_arguments() {
    check::section("explicit arguments");
    Runtime rt(quiet());

    Value add = Value::function({Label("a"), Label("b")}, Block{
        Command::eval(bin(OpCode::SUB, var("a"), var("b"))),
        Command::return_value(Lookup::result()),
    });

    std::vector<Command> code = program();
    define(code, "sub", add);
    code.push_back(Command::eval(Expression::local(Lookup::var(Label("sub")), {k(Value(30)), k(Value(8))})));
    auto out = rt.evaluate(Block(code));
    CHECK_OK(out);
    if (out) CHECK(*out == Value(22));

    // Stack values come before explicit arguments.
    code = program();
    define(code, "sub", add);
    code.push_back(Command::push(kv(Value(100))));
    code.push_back(Command::eval(Expression::local(Lookup::var(Label("sub")), {k(Value(1))})));
    out = rt.evaluate(Block(code));
    CHECK_OK(out);
    if (out) CHECK(*out == Value(99));

    code = program();
    define(code, "sub", add);
    code.push_back(Command::eval(Expression::local(Lookup::var(Label("sub")), {k(Value(1))})));
    CHECK_FAILS_WITH(rt.evaluate(Block(code)), ErrorKind::NotEnoughArguments);

    code = program();
    define(code, "sub", Value(5));
    code.push_back(Command::eval(Expression::local(Lookup::var(Label("sub")))));
    CHECK_FAILS_WITH(rt.evaluate(Block(code)), ErrorKind::BadInstruction);

    // An empty body yields the caller's last result.
    code = program();
    define(code, "noop", Value::function({}, Block{}));
    code.push_back(Command::load(kv(Value("before"))));
    code.push_back(Command::eval(Expression::local(Lookup::var(Label("noop")))));
    out = rt.evaluate(Block(code));
    CHECK_OK(out);
    if (out) CHECK(*out == Value("before"));
}

static void test_fall_through_keeps_callee_frame() {
    check::section("fall through does not restore the caller");
    Runtime rt(quiet());

    Value leaky = Value::function({Label("x")}, Block{
        Command::load(kv(Value("callee"))),
        Command::store(Label("leak")),
        Command::push(kv(Value(99))),
    });

    std::vector<Command> code;
    define(code, "leaky", leaky);
    code.push_back(Command::push(kv(Value(7))));
    code.push_back(Command::eval(Expression::local(Lookup::var(Label("leaky")))));
    code.push_back(Command::load(kv(Value("caller continued"))));

    auto out = rt.evaluate(Block(code));
    CHECK_OK(out);
    if (out) CHECK(*out == Value("callee"));

    // The callee's registers and stack are what the caller is left with.
    CHECK(rt.registers().find(Label("leaky")) == nullptr);
    CHECK(rt.registers().find(Label("leak")) != nullptr);
    CHECK(rt.registers().find(Label("x")) && *rt.registers().find(Label("x")) == Value(7));
    std::vector<Value> expected{Value(99), Value("callee")};
    CHECK(std::ranges::equal(rt.stack(), expected));
    CHECK_EQ(rt.current_block().size(), size_t(3));
}

static void test_goto() {
    check::section("goto");
    Runtime rt(quiet());

    Value twice = Value::function({Label("n")}, Block{
        Command::eval(bin(OpCode::MUL, var("n"), k(Value(2)))),
    });

    std::vector<Command> code;
    define(code, "twice", twice);
    code.push_back(Command::push(kv(Value("junk"))));
    code.push_back(Command::eval(Expression::go_to(Lookup::var(Label("twice")), {k(Value(4))})));
    code.push_back(Command::load(kv(Value("never"))));

    auto out = rt.evaluate(Block(code));
    CHECK_OK(out);
    if (out) CHECK(*out == Value(8));
    CHECK(rt.stack().empty());
    CHECK(rt.registers().find(Label("twice")) == nullptr);
    CHECK(rt.registers().find(Label("n")) != nullptr);

    code.clear();
    define(code, "twice", Value("not a function"));
    code.push_back(Command::eval(Expression::go_to(Lookup::var(Label("twice")))));
    CHECK_FAILS_WITH(rt.evaluate(Block(code)), ErrorKind::BadInstruction);
}

// fact(n) through the current module's public namespace.
static Module factorial_module() {
    Value fact = Value::function({Label("n")}, Block{
        Command::eval(bin(OpCode::LE, var("n"), k(Value(1)))),
        Command::store(Label("base")),
        Command::when(Lookup::var(Label("base")), Command::return_value(kv(Value(1)))),
        Command::eval(bin(OpCode::SUB, var("n"), k(Value(1)))),
        Command::store(Label("m")),
        Command::eval(Expression::local(Lookup::deref(Label("fact")), {var("m")})),
        Command::eval(bin(OpCode::MUL, var("n"), Expression::take(Lookup::result()))),
        Command::return_value(Lookup::result()),
    });
    Module module;
    module.set_public(Label("fact"), fact);
    return module;
}

static void test_recursion() {
    check::section("recursion");

    Runtime rt(quiet());
    rt.set_current_module(factorial_module());
    auto out = rt.evaluate(Expression::local(Lookup::deref(Label("fact")), {k(Value(10))}));
    CHECK_OK(out);
    if (out) CHECK(*out == Value(3628800));
    CHECK_EQ(rt.call_depth(), size_t(0));

    RuntimeConfig shallow = quiet();
    shallow.max_call_depth = 8;
    Runtime limited(shallow);
    limited.set_current_module(factorial_module());
    auto deep = limited.evaluate(Expression::local(Lookup::deref(Label("fact")), {k(Value(50))}));
    CHECK_FAILS_WITH(deep, ErrorKind::CallDepthExceeded);
    if (!deep) CHECK(deep.error().field("limit") && *deep.error().field("limit") == Value(8));
    CHECK_EQ(limited.call_depth(), size_t(0));
}

static void test_errors_pass_through_calls() {
    check::section("errors pass through calls");
    Runtime rt(quiet());

    Value thrower = Value::function({}, Block{
        Command::throw_value(kv(Value("oops"))),
        Command::return_value(kv(Value("unreached"))),
    });

    std::vector<Command> code;
    define(code, "thrower", thrower);
    code.push_back(Command::eval(Expression::local(Lookup::var(Label("thrower")))));

    auto out = rt.evaluate(Block(code));
    CHECK(!out.has_value());
    if (!out) CHECK(out.error().error == Value("oops"));
}

int main() {
    test_binding_and_leftovers();
    test_explicit_arguments();
    test_fall_through_keeps_callee_frame();
    test_goto();
    test_recursion();
    test_errors_pass_through_calls();
    return check::summary("calls");
}
