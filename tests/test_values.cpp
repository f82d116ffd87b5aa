#include "check.h"
#include <dao/value.h>
#include <dao/cast.h>
#include <dao/bytecode/instruction.h>
#include <set>

using namespace dao;

static void test_construction() {
    check::section("construction");

    CHECK(Value().is_null());
    CHECK(Value::truth().is_true());
    CHECK(Value::boolean(false).is_null());
    CHECK(Value::boolean(true).is_true());
    CHECK(Value(42).is_int());
    CHECK(Value(size_t(7)).is_int());
    CHECK(Value(1.5).is_float());
    CHECK(Value("text").is_string());
    CHECK(Value(std::string("text")).is_string());
    CHECK(Value(Address("a.b")).is_pointer());

    Value empty = Value::list({});
    CHECK(empty.is_list());
    CHECK(empty.as_list().empty());
    CHECK(empty == Value(list_t{}));
    CHECK(empty == Value(std::make_shared<const std::vector<Value>>()));

    Value list = Value::list({Value(1), Value(2)});
    CHECK_EQ(list.as_list().size(), size_t(2));
    CHECK(list.as_list()[1] == Value(2));

    Fields fields;
    fields[Label("x")] = Value(3);
    Value point = Value::data(Address("geo.Point"), fields);
    CHECK(point.is_data());
    CHECK(point.as_data().tag == Address("geo.Point"));
    CHECK(point.as_data().field(Label("x")) != nullptr);
    CHECK(point.as_data().field(Label("y")) == nullptr);

    Value fn = Value::function({Label("a")}, Block{Command::return_value(Lookup::var(Label("a")))});
    CHECK(fn.is_function());
    CHECK_EQ(fn.as_function().params.size(), size_t(1));
    CHECK_EQ(fn.as_function().body.size(), size_t(1));
}

static void test_ordering() {
    check::section("ordering");

    // Type order comes first.
    CHECK(Value() < Value::truth());
    CHECK(Value::truth() < Value(-100));
    CHECK(Value(1000) < Value(0.5));
    CHECK(Value(0.5) < Value(""));
    CHECK(Value("zzz") < Value(Address("a")));
    CHECK(Value(Address("z")) < Value::list({}));

    CHECK(Value(1) < Value(2));
    CHECK(Value("abc") < Value("abd"));
    CHECK(Value(Address("a")) < Value(Address("a.b")));

    // Lists by length, then element-wise.
    CHECK(Value::list({Value(9)}) < Value::list({Value(1), Value(1)}));
    CHECK(Value::list({Value(1), Value(2)}) < Value::list({Value(1), Value(3)}));
    CHECK(Value::list({Value(1), Value(2)}) == Value::list({Value(1), Value(2)}));

    // Structural equality across separate allocations.
    Fields a;
    a[Label("k")] = Value("v");
    Fields b;
    b[Label("k")] = Value("v");
    CHECK(Value::data(Address("T"), a) == Value::data(Address("T"), b));
    CHECK(Value::data(Address("T"), a) != Value::data(Address("U"), b));

    Block body{Command::load(Lookup::value(Value(1)))};
    CHECK(Value::function({}, body) == Value::function({}, Block{Command::load(Lookup::value(Value(1)))}));
    CHECK(Value::function({}, body) != Value::function({Label("p")}, body));

    // Usable as a set key.
    std::set<Value> keys{Value(1), Value("1"), Value(1), Value(), Value::truth()};
    CHECK_EQ(keys.size(), size_t(4));
}

static void test_casts() {
    check::section("casts");

    CHECK(as_bool(Value()) == std::optional<bool>(false));
    CHECK(as_bool(Value::truth()) == std::optional<bool>(true));
    CHECK(!as_bool(Value(0)).has_value());

    CHECK(as_int(Value(5)) == std::optional<int_t>(5));
    CHECK(!as_int(Value(5.0)).has_value());
    CHECK(as_float(Value(2.5)) == std::optional<float_t>(2.5));
    CHECK(as_str(Value("hi")) == std::optional<std::string_view>("hi"));
    CHECK(!as_str(Value(1)).has_value());
    CHECK(as_pointer(Value(Address("m"))) == std::optional<Address>(Address("m")));

    CHECK(as_list(Value::list({Value(1)})).has_value());
    CHECK(!as_list(Value()).has_value());

    CHECK(as_func(Value(1)) == nullptr);

    Value point = Value::data(Address("geo.Point"), {});
    CHECK(as_data(point, Address("geo.Point")) != nullptr);
    CHECK(as_data(point, Address("geo.Line")) == nullptr);
    CHECK(member(point, Address("geo.Point"), Label("x")) == nullptr);
}

static void test_rendering() {
    check::section("rendering");

    CHECK_EQ(to_string(Value()), std::string("null"));
    CHECK_EQ(to_string(Value::truth()), std::string("true"));
    CHECK_EQ(to_string(Value(-3)), std::string("-3"));
    CHECK_EQ(to_string(Value("a\"b")), std::string("\"a\\\"b\""));
    CHECK_EQ(to_string(Value(Address("io.print"))), std::string("&io.print"));
    CHECK_EQ(to_string(Value::list({Value(1), Value("x")})), std::string("[1, \"x\"]"));
    CHECK_EQ(to_string(Value::list({})), std::string("[]"));

    Fields fields;
    fields[Label("x")] = Value(1);
    CHECK_EQ(to_string(Value::data(Address("P"), fields)), std::string("P{x: 1}"));

    Value fn = Value::function({Label("a"), Label("b")}, Block{Command::pop()});
    CHECK_EQ(to_string(fn), std::string("func(a, b){1 commands}"));

    CHECK_EQ(type_name(Value("s").type()), std::string_view("Str"));
    CHECK_EQ(type_name(fn.type()), std::string_view("Func"));
}

int main() {
    test_construction();
    test_ordering();
    test_casts();
    test_rendering();
    return check::summary("values");
}
