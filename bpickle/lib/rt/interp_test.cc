#include <gtest/gtest.h>
#include <rt/runtime.h>
#include <rt/parse_asm.h>

namespace {
using namespace bpickle::rt;

std::shared_ptr<module> run_main(runtime &rt, std::string_view src) {
  rt.exec_in(rt.main_module(), parse_asm::parse_module(src));
  return rt.main_module();
}

int64_t int_of(const ref &r) {
  auto i = as<integer>(r);
  if (!i)throw std::runtime_error("not an integer: " + repr(r));
  return i->v;
}

constexpr std::string_view counter_src = R"(
.code <module>
  load_const @make_counter
  load_const "make_counter"
  make_function $0
  store_global make_counter
  load_const none
  return_value
.end

.code make_counter
.cellvars count
  load_const $0
  store_deref count
  load_closure count
  build_tuple $1
  load_const @make_counter.<locals>.incr
  load_const "make_counter.<locals>.incr"
  make_function $8
  return_value
.end

.code make_counter.<locals>.incr
.freevars count
  load_deref count
  load_const $1
  binary_add
  dup_top
  store_deref count
  return_value
.end
)";

TEST(Interp, ClosureCounter) {
  runtime rt;
  auto m = run_main(rt, counter_src);
  ref counter = rt.call(rt.getattr(m, "make_counter"), {});
  auto f = as<function>(counter);
  ASSERT_NE(f, nullptr);
  EXPECT_EQ(f->qualname, "make_counter.<locals>.incr");
  EXPECT_EQ(f->name, "incr");
  EXPECT_EQ(f->module.value_or(""), "__main__");
  ASSERT_EQ(f->closure.size(), 1);
  EXPECT_EQ(int_of(rt.call(counter, {})), 1);
  EXPECT_EQ(int_of(rt.call(counter, {})), 2);
  EXPECT_EQ(int_of(f->closure[0]->contents), 2);

  ref other = rt.call(rt.getattr(m, "make_counter"), {});
  EXPECT_EQ(int_of(rt.call(other, {})), 1);
}

TEST(Interp, ClassWithMethodReturningItsClass) {
  runtime rt;
  auto m = run_main(rt, R"(
.code <module>
  build_tuple $0
  load_const "m"
  load_const @C.m
  load_const "C.m"
  make_function $0
  build_map $1
  load_const "C"
  load_const "C"
  build_class
  store_global C
  load_const none
  return_value
.end

.code C.m
.args self
  load_global C
  return_value
.end
)");
  auto c = as<type>(rt.getattr(m, "C"));
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->module, "__main__");
  ref obj = rt.call(c, {});
  EXPECT_EQ(rt.type_of(obj), c);
  EXPECT_EQ(rt.call(rt.getattr(obj, "m"), {}), c);
}

TEST(Interp, InitAndAttributes) {
  runtime rt;
  auto m = run_main(rt, R"(
.code <module>
  build_tuple $0
  load_const "__init__"
  load_const @P.__init__
  load_const "P.__init__"
  make_function $0
  build_map $1
  load_const "P"
  load_const "P"
  build_class
  store_global P
  load_const none
  return_value
.end

.code P.__init__
.args self x
  load_fast x
  load_fast self
  store_attr x
  load_const none
  return_value
.end
)");
  ref p = rt.call(rt.getattr(m, "P"), {make_int(41)});
  EXPECT_EQ(int_of(rt.getattr(p, "x")), 41);
  EXPECT_THROW(rt.getattr(p, "y"), error::attribute_error);
}

TEST(Interp, DefaultsAndArity) {
  runtime rt;
  auto m = run_main(rt, R"(
.code <module>
  load_const $10
  build_tuple $1
  load_const @add
  load_const "add"
  make_function $1
  store_global add
  load_const none
  return_value
.end

.code add
.args a b
  load_fast a
  load_fast b
  binary_add
  return_value
.end
)");
  ref add = rt.getattr(m, "add");
  EXPECT_EQ(int_of(rt.call(add, {make_int(1)})), 11);
  EXPECT_EQ(int_of(rt.call(add, {make_int(1), make_int(2)})), 3);
  EXPECT_THROW(rt.call(add, {}), error::type_error);
  EXPECT_THROW(rt.call(add, {make_int(1), make_int(2), make_int(3)}), error::type_error);
}

TEST(Interp, BranchesAndComparison) {
  runtime rt;
  auto m = run_main(rt, R"(
.code <module>
  load_const @fact
  load_const "fact"
  make_function $0
  store_global fact
  load_const none
  return_value
.end

.code fact
.args n
  load_fast n
  load_const $2
  compare_lt
  pop_jump_if_false rec
  load_const $1
  return_value
rec:
  load_fast n
  load_global fact
  load_fast n
  load_const $1
  binary_sub
  call $1
  binary_mul
  return_value
.end
)");
  EXPECT_EQ(int_of(rt.call(rt.getattr(m, "fact"), {make_int(10)})), 3628800);
}

TEST(Interp, UnboundNames) {
  runtime rt;
  auto m = run_main(rt, R"(
.code <module>
  load_const @g
  load_const "g"
  make_function $0
  store_global g
  load_const none
  return_value
.end

.code g
  load_global undefined_thing
  return_value
.end
)");
  EXPECT_THROW(rt.call(rt.getattr(m, "g"), {}), error::name_error);
}

TEST(Interp, CellVarInitializedFromArgument) {
  runtime rt;
  auto m = run_main(rt, R"(
.code <module>
  load_const @outer
  load_const "outer"
  make_function $0
  store_global outer
  load_const none
  return_value
.end

.code outer
.args v
.cellvars v
  load_closure v
  build_tuple $1
  load_const @outer.<locals>.inner
  load_const "outer.<locals>.inner"
  make_function $8
  return_value
.end

.code outer.<locals>.inner
.freevars v
  load_deref v
  return_value
.end
)");
  ref inner = rt.call(rt.getattr(m, "outer"), {make_str("x")});
  EXPECT_EQ(as<string>(rt.call(inner, {}))->v, "x");
}

TEST(Interp, EnumAndImport) {
  runtime rt;
  rt.register_loader("pkg", [](runtime &, module &) {});
  rt.register_loader("pkg.sub", [](runtime &, module &m) { m.ns->set("answer", make_int(42)); });
  auto m = run_main(rt, R"(
.code <module>
  load_const "RED"
  load_const $1
  load_const "GREEN"
  load_const $2
  build_map $2
  load_const "Color"
  load_const "Color"
  build_enum
  store_global Color
  import_name pkg.sub
  store_global pkg
  load_global pkg
  load_attr sub
  load_attr answer
  store_global answer
  load_const none
  return_value
.end
)");
  auto color = as<type>(rt.getattr(m, "Color"));
  ASSERT_NE(color, nullptr);
  EXPECT_EQ(color->meta, type::enumeration);
  ASSERT_EQ(color->members.size(), 2);
  EXPECT_EQ(color->members[1]->name, "GREEN");
  EXPECT_EQ(rt.call(color, {make_int(2)}), color->members[1]);
  EXPECT_EQ(int_of(rt.getattr(m, "answer")), 42);
  EXPECT_NE(rt.find_module("pkg.sub"), nullptr);
}

TEST(Interp, RecursionLimit) {
  runtime rt;
  auto m = run_main(rt, R"(
.code <module>
  load_const @loop
  load_const "loop"
  make_function $0
  store_global loop
  load_const none
  return_value
.end

.code loop
  load_global loop
  call $0
  return_value
.end
)");
  EXPECT_THROW(rt.call(rt.getattr(m, "loop"), {}), error::t);
  // the depth counter unwinds with the frames
  EXPECT_EQ(int_of(rt.call(rt.getattr(rt.builtins(), "len"), {make_str("ab")})), 2);
}

}
