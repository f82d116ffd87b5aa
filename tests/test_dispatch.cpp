#include "check.h"
#include <dao/runtime.h>
#include <dao/bytecode/instruction.h>

using namespace dao;

namespace {
    RuntimeConfig quiet() {
        RuntimeConfig config;
        config.report_errors = false;
        return config;
    }

    Expression k(Value v) { return Expression::constant(std::move(v)); }
    Lookup kv(Value v) { return Lookup::value(std::move(v)); }

    std::vector<std::string> words(std::initializer_list<const char*> list) {
        return std::vector<std::string>(list.begin(), list.end());
    }

    // Counts every rule that fired in the module's private `count`.
    Block bump() {
        return Block{
            Command::eval(Expression::binary(OpCode::ADD, Expression::take(Lookup::deref(Label("count"))), k(Value(1)))),
            Command::update(Lookup::result(), Label("count")),
            Command::load(Lookup::deref(Label("count"))),
        };
    }
}

static void test_prefix_match() {
    check::section("prefix match");
    Runtime rt(quiet());

    Module greeter;
    greeter.rules.push_back(Rule{words({"my", "name", "is"}), Block{Command::clear_forward()}});

    auto out = rt.dispatch(words({"my", "name", "is", "Dave"}), greeter);
    CHECK_OK(out);
    if (out) CHECK(*out == Value::list({Value("Dave")}));

    // Head of the remainder pops first.
    Module popper;
    popper.rules.push_back(Rule{words({"my", "name", "is"}), Block{Command::pop()}});
    auto first = rt.dispatch(words({"my", "name", "is", "Dave", "Smith"}), popper);
    CHECK_OK(first);
    if (first) CHECK(*first == Value("Dave"));

    // Shorter input than the pattern never matches.
    rt.set_last_result(Value("untouched"));
    auto none = rt.dispatch(words({"my", "name"}), greeter);
    CHECK_OK(none);
    if (none) CHECK(*none == Value("untouched"));

    Rule catch_all{words({}), Block{}};
    CHECK(catch_all.matches(words({"anything"})));
    Rule pair{words({"a", "b"}), Block{}};
    CHECK(!pair.matches(words({"a", "c"})));
}

static void test_all_rules_run() {
    check::section("all matching rules run");
    Runtime rt(quiet());

    Module counter;
    counter.set_private(Label("count"), Value(0));
    counter.rules.push_back(Rule{words({"hello"}), bump()});
    counter.rules.push_back(Rule{words({"bye"}), bump()});
    counter.rules.push_back(Rule{words({"hello", "world"}), bump()});

    rt.push(Value("outer"));
    auto out = rt.dispatch(words({"hello", "world"}), counter);
    CHECK_OK(out);
    if (out) CHECK(*out == Value(2));
    CHECK(rt.current_module() && *rt.current_module()->find_private(Label("count")) == Value(2));

    // The caller's stack comes back after each action.
    CHECK_EQ(rt.stack().size(), size_t(1));
    if (rt.stack().size() == 1) CHECK(rt.stack()[0] == Value("outer"));

    // A Return finishes only its own action.
    Module early;
    early.rules.push_back(Rule{words({"go"}), Block{Command::return_value(kv(Value("first"))),
                                                    Command::load(kv(Value("skipped")))}});
    early.rules.push_back(Rule{words({"go"}), Block{Command::load(kv(Value("second")))}});
    auto both = rt.dispatch(words({"go"}), early);
    CHECK_OK(both);
    if (both) CHECK(*both == Value("second"));
}

static void test_errors_stop_dispatch() {
    check::section("errors stop dispatch");
    Runtime rt(quiet());

    Module fragile;
    fragile.set_private(Label("count"), Value(0));
    fragile.rules.push_back(Rule{words({"x"}), Block{Command::throw_value(kv(Value("stop")))}});
    fragile.rules.push_back(Rule{words({"x"}), bump()});

    rt.push(Value("kept"));
    auto out = rt.dispatch(words({"x"}), fragile);
    CHECK(!out.has_value());
    if (!out) CHECK(out.error().error == Value("stop"));
    CHECK(*rt.current_module()->find_private(Label("count")) == Value(0));
    CHECK_EQ(rt.stack().size(), size_t(1));

    Module broken;
    broken.rules.push_back(Rule{words({"x"}), Block{Command::load(Lookup::var(Label("ghost")))}});
    CHECK_FAILS_WITH(rt.dispatch(words({"x"}), broken), ErrorKind::UndefinedVariable);
}

static void test_selection() {
    check::section("module selection");
    Runtime rt(quiet());

    Module a;
    a.set_private(Label("count"), Value(0));
    a.rules.push_back(Rule{words({"ping"}), bump()});
    Module b;
    b.set_private(Label("count"), Value(10));
    b.rules.push_back(Rule{words({"ping"}), bump()});

    CHECK_OK(rt.activate_module(Address("bots.a"), a));
    CHECK_OK(rt.activate_module(Address("bots.b"), b));

    // Unknown and malformed queries are reported and skipped.
    auto picked = rt.select_modules(words({"bots.b", "bots.zzz", "bad..name"}));
    CHECK_EQ(picked.size(), size_t(1));

    auto all = rt.select_all_modules();
    CHECK_EQ(all.size(), size_t(2));

    auto out = rt.dispatch(words({"ping"}), std::span<const Module>(all));
    CHECK_OK(out);
    if (out) CHECK(*out == Value(11));

    auto single = rt.dispatch(words({"ping"}), std::span<const Module>(picked));
    CHECK_OK(single);
    if (single) CHECK(*single == Value(11));

    // Updates live in the dispatch's copy, not in the loaded module.
    auto loaded = rt.lookup_module(Address("bots.b"));
    CHECK_OK(loaded);
    if (loaded) CHECK(*loaded->find_private(Label("count")) == Value(10));
}

int main() {
    test_prefix_match();
    test_all_rules_run();
    test_errors_stop_dispatch();
    test_selection();
    return check::summary("dispatch");
}
