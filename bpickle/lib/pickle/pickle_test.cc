#include <gtest/gtest.h>
#include <pickle/pickler.h>
#include <pickle/unpickler.h>

namespace {
using namespace bpickle;
using rt::as;

// a library module every runtime can import
void load_shapes(rt::runtime &rt, rt::module &m) {
  auto point = rt.make_class("Point", "Point", m.name);
  m.ns->set("Point", point);
  m.ns->set("Axis", rt.make_enum("Axis", "Axis", m.name, {{"X", rt::make_int(0)}, {"Y", rt::make_int(1)}}));
  rt.make_native("norm", [](rt::runtime &, rt::args_t &) -> rt::ref { return rt::make_int(0); },
                 std::static_pointer_cast<rt::module>(m.shared_from_this()));
}

rt::ref round_trip(rt::runtime &from, rt::runtime &to, const rt::ref &obj) {
  pickle::pickler p(from);
  std::string bytes = p.dumps(obj);
  pickle::unpickler u(to);
  return u.loads(bytes);
}

TEST(Pickle, Scalars) {
  rt::runtime a, b;
  EXPECT_TRUE(rt::is_none(round_trip(a, b, rt::none())));
  EXPECT_EQ(round_trip(a, b, rt::ellipsis()), rt::ellipsis());
  EXPECT_EQ(round_trip(a, b, rt::make_bool(true)), rt::make_bool(true));
  EXPECT_EQ(as<rt::integer>(round_trip(a, b, rt::make_int(-1234567890123)))->v, -1234567890123);
  EXPECT_DOUBLE_EQ(as<rt::floating>(round_trip(a, b, std::make_shared<rt::floating>(2.5)))->v, 2.5);
  EXPECT_EQ(as<rt::string>(round_trip(a, b, rt::make_str(std::string("a\0b", 3))))->v, std::string("a\0b", 3));
}

TEST(Pickle, SharedAndCyclicContainers) {
  rt::runtime a, b;
  auto shared = std::make_shared<rt::list>();
  shared->items.push_back(rt::make_int(1));
  auto outer = std::make_shared<rt::list>();
  outer->items = {shared, shared};
  outer->items.push_back(outer);
  auto d = std::make_shared<rt::dict>();
  d->set(rt::make_tuple({rt::make_str("k"), rt::make_int(2)}), outer);

  auto back = as<rt::dict>(round_trip(a, b, d));
  ASSERT_NE(back, nullptr);
  ASSERT_EQ(back->size(), 1);
  auto l = as<rt::list>(back->get(rt::make_tuple({rt::make_str("k"), rt::make_int(2)})));
  ASSERT_NE(l, nullptr);
  ASSERT_EQ(l->items.size(), 3);
  EXPECT_EQ(l->items[0], l->items[1]);
  EXPECT_EQ(l->items[2], l);
  EXPECT_EQ(as<rt::integer>(as<rt::list>(l->items[0])->items[0])->v, 1);
}

TEST(Pickle, ByReferenceAndInstances) {
  rt::runtime a, b;
  a.register_loader("shapes", load_shapes);
  b.register_loader("shapes", load_shapes);
  auto shapes = a.import_module("shapes");
  auto p = a.call(a.getattr(shapes, "Point"), {});
  a.setattr(p, "x", rt::make_int(3));
  auto axis_y = a.getattr(a.getattr(shapes, "Axis"), "Y");
  auto norm = a.getattr(shapes, "norm");

  auto back = as<rt::tuple>(round_trip(a, b, rt::make_tuple({p, p, axis_y, norm})));
  ASSERT_NE(back, nullptr);
  auto b_shapes = b.find_module("shapes");
  ASSERT_NE(b_shapes, nullptr);
  EXPECT_EQ(b.type_of(back->items[0]), b.getattr(b_shapes, "Point"));
  EXPECT_EQ(back->items[0], back->items[1]);
  EXPECT_EQ(as<rt::integer>(b.getattr(back->items[0], "x"))->v, 3);
  EXPECT_EQ(back->items[2], b.getattr(b.getattr(b_shapes, "Axis"), "Y"));
  EXPECT_EQ(back->items[3], b.getattr(b_shapes, "norm"));
}

TEST(Pickle, LocalFunctionIsNotReferenceable) {
  rt::runtime a;
  auto co = std::make_shared<rt::code>();
  co->name = "g";
  co->qualname = "f.<locals>.g";
  auto g = a.make_function(co, a.main_module()->ns, co->qualname);
  pickle::pickler p(a);
  EXPECT_THROW(p.dumps(g), pickle::error::pickling_error);
}

TEST(Pickle, ShadowedNameIsNotTheSameObject) {
  rt::runtime a;
  auto m = a.add_module("lib");
  auto c = a.make_class("C", "C", "lib");
  m->ns->set("C", a.make_class("C", "C", "lib"));
  pickle::pickler p(a);
  EXPECT_THROW(p.dumps(c), pickle::error::pickling_error);
}

TEST(Pickle, UnsupportedKinds) {
  rt::runtime a;
  pickle::pickler p(a);
  EXPECT_THROW(p.dumps(std::make_shared<rt::lock>()), pickle::error::unsupported_object);
  EXPECT_THROW(p.dumps(std::make_shared<rt::cell>()), pickle::error::unsupported_object);
}

class lock_pickler : public pickle::pickler {
 public:
  using pickle::pickler::pickler;
  int overrides = 0;
 protected:
  std::optional<pickle::reduce_value> reducer_override(const rt::ref &obj) override {
    if (obj->is(rt::kind_t::lock))++overrides;
    return {};
  }
};

TEST(Pickle, DispatchTableAfterOverride) {
  rt::runtime a, b;
  lock_pickler p(a);
  p.dispatch_table[rt::kind_t::lock] = [&](const rt::ref &) {
    return pickle::reduce_value{a.getattr(a.builtins(), "Lock"), {}, {}, nullptr};
  };
  auto l = std::make_shared<rt::lock>();
  std::string bytes = p.dumps(rt::make_tuple({l, l}));
  EXPECT_EQ(p.overrides, 1);
  pickle::unpickler u(b);
  auto back = as<rt::tuple>(u.loads(bytes));
  ASSERT_NE(back, nullptr);
  EXPECT_TRUE(back->items[0]->is(rt::kind_t::lock));
  EXPECT_EQ(back->items[0], back->items[1]);
  EXPECT_NE(back->items[0], l);
}

TEST(Pickle, RecursiveReductionIsAnError) {
  rt::runtime a;
  pickle::pickler p(a);
  p.dispatch_table[rt::kind_t::lock] = [&](const rt::ref &self) {
    return pickle::reduce_value{a.getattr(a.builtins(), "Lock"), {self}, {}, nullptr};
  };
  EXPECT_THROW(p.dumps(std::make_shared<rt::lock>()), pickle::error::pickling_error);
}

TEST(Unpickle, Corruption) {
  rt::runtime a, b;
  pickle::pickler p(a);
  std::string bytes = p.dumps(rt::make_tuple({rt::make_str("abc"), rt::make_int(1)}));
  pickle::unpickler u(b);
  EXPECT_THROW(u.loads(""), pickle::error::corruption);
  EXPECT_THROW(u.loads(std::string_view(bytes).substr(0, bytes.size() - 3)), pickle::error::corruption);
  EXPECT_THROW(u.loads(bytes + "x"), pickle::error::corruption);
  std::string bad_tag = bytes;
  bad_tag[2] = '\x01';
  EXPECT_THROW(u.loads(bad_tag), pickle::error::corruption);
  std::string bad_memo = "\x80\x01h";
  bad_memo += std::string(8, '\0');
  bad_memo += ".";
  EXPECT_THROW(u.loads(bad_memo), pickle::error::corruption);
}

TEST(Unpickle, UnknownGlobal) {
  rt::runtime a, b;
  a.register_loader("shapes", load_shapes);
  auto point = a.getattr(a.import_module("shapes"), "Point");
  pickle::pickler p(a);
  std::string bytes = p.dumps(point);
  pickle::unpickler u(b);
  EXPECT_THROW(u.loads(bytes), pickle::error::corruption);
  b.register_loader("shapes", [](rt::runtime &, rt::module &) {});
  EXPECT_THROW(u.loads(bytes), pickle::error::corruption);
}

}
