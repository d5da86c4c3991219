#include <gtest/gtest.h>
#include <rt/runtime.h>

namespace {
using namespace bpickle::rt;

TEST(Object, SameKey) {
  EXPECT_TRUE(same_key(make_int(3), make_int(3)));
  EXPECT_FALSE(same_key(make_int(3), make_str("3")));
  EXPECT_TRUE(same_key(make_tuple({make_str("a"), make_int(1)}), make_tuple({make_str("a"), make_int(1)})));
  EXPECT_FALSE(same_key(std::make_shared<list>(), std::make_shared<list>()));
}

TEST(Object, Repr) {
  EXPECT_EQ(repr(none()), "None");
  EXPECT_EQ(repr(make_str("a\nb")), "'a\\nb'");
  EXPECT_EQ(repr(make_tuple({make_int(1)})), "(1,)");
  auto d = std::make_shared<dict>();
  d->set("k", make_bool(true));
  EXPECT_EQ(repr(d), "{'k': True}");
}

TEST(Object, DictKeepsInsertionOrder) {
  dict d;
  d.set("b", make_int(1));
  d.set("a", make_int(2));
  d.set("b", make_int(3));
  ASSERT_EQ(d.size(), 2);
  EXPECT_EQ(as<string>(d.entries[0].first)->v, "b");
  EXPECT_EQ(as<integer>(d.get("b"))->v, 3);
  EXPECT_TRUE(d.erase("a"));
  EXPECT_FALSE(d.contains("a"));
}

TEST(Object, LockAcquireRelease) {
  lock l;
  EXPECT_FALSE(l.locked());
  EXPECT_TRUE(l.acquire());
  EXPECT_TRUE(l.locked());
  EXPECT_FALSE(l.acquire(false));
  l.release();
  EXPECT_FALSE(l.locked());
  EXPECT_THROW(l.release(), error::value_error);
}

TEST(Object, StreamModes) {
  stream r("in.txt", stream::read, "abc");
  EXPECT_EQ(r.read_all(), "abc");
  EXPECT_EQ(r.remaining(), "");
  EXPECT_THROW(r.write_text("x"), error::value_error);
  stream w("out.txt", stream::write);
  w.write_text("xy");
  EXPECT_EQ(w.content, "xy");
  w.closed = true;
  EXPECT_THROW(w.write_text("z"), error::value_error);
}

TEST(Object, WeakSetDropsDeadItems) {
  weak_set s;
  ref kept = make_str("kept");
  {
    ref gone = make_str("gone");
    s.add(kept);
    s.add(gone);
    s.add(kept);
    EXPECT_EQ(s.live().size(), 2);
  }
  ASSERT_EQ(s.live().size(), 1);
  EXPECT_EQ(s.live()[0], kept);
}

TEST(Runtime, StandardModules) {
  runtime rt;
  EXPECT_NE(rt.find_module("builtins"), nullptr);
  EXPECT_NE(rt.find_module("copyreg"), nullptr);
  EXPECT_EQ(rt.find_module("__main__"), rt.main_module());
  EXPECT_EQ(rt.main_module()->origin, module::ad_hoc);
  EXPECT_EQ(rt.builtins()->origin, module::builtin);
}

TEST(Runtime, ImportBindsSubmoduleOnParent) {
  runtime rt;
  int loads = 0;
  rt.register_loader("pkg", [&](runtime &, module &) { ++loads; });
  rt.register_loader("pkg.sub", [&](runtime &, module &m) {
    ++loads;
    m.ns->set("x", make_int(1));
  });
  EXPECT_TRUE(rt.is_importable("pkg.sub"));
  EXPECT_EQ(rt.find_module("pkg"), nullptr);
  auto sub = rt.import_module("pkg.sub");
  EXPECT_EQ(loads, 2);
  EXPECT_EQ(rt.getattr(rt.find_module("pkg"), "sub"), sub);
  EXPECT_EQ(rt.import_module("pkg.sub"), sub);
  EXPECT_EQ(loads, 2);
  EXPECT_THROW(rt.import_module("nope"), error::import_error);
}

TEST(Runtime, FailedLoaderLeavesNoModule) {
  runtime rt;
  rt.register_loader("broken", [](runtime &, module &) { throw error::value_error("boom"); });
  EXPECT_THROW(rt.import_module("broken"), error::value_error);
  EXPECT_EQ(rt.find_module("broken"), nullptr);
}

TEST(Runtime, LookupQualified) {
  runtime rt;
  auto m = rt.add_module("lib");
  auto outer = rt.make_class("Outer", "Outer", "lib");
  auto inner = rt.make_class("Inner", "Outer.Inner", "lib");
  outer->attrs["Inner"] = inner;
  m->ns->set("Outer", outer);
  EXPECT_EQ(rt.lookup_qualified(m, "Outer.Inner"), inner);
  EXPECT_THROW(rt.lookup_qualified(m, "Outer.Missing"), error::attribute_error);
  EXPECT_THROW(rt.lookup_qualified(m, "f.<locals>.g"), error::attribute_error);
}

TEST(Runtime, FallbackGetattr) {
  runtime rt;
  auto m = rt.add_module("lazy");
  m->fallback_getattr = [](std::string_view name) -> ref {
    if (name == "magic")return make_int(7);
    return nullptr;
  };
  EXPECT_EQ(as<integer>(rt.getattr(m, "magic"))->v, 7);
  EXPECT_THROW(rt.getattr(m, "other"), error::attribute_error);
  EXPECT_FALSE(rt.try_getattr(m, "other").has_value());
}

TEST(Runtime, Descriptors) {
  runtime rt;
  auto getter = rt.make_native("get", [](runtime &, args_t &a) -> ref { return make_int(a.size()); });
  auto p = std::make_shared<property>();
  p->fget = getter;
  auto cm = std::make_shared<class_method>(getter);
  auto sm = std::make_shared<static_method>(getter);
  auto c = rt.make_class("C", "C", "lib", {}, {{"p", p}, {"cm", cm}, {"sm", sm}});
  ref obj = rt.call(c, {});
  EXPECT_EQ(as<integer>(rt.getattr(obj, "p"))->v, 1);
  EXPECT_EQ(as<integer>(rt.call(rt.getattr(c, "cm"), {}))->v, 1);
  EXPECT_EQ(rt.getattr(c, "sm"), getter);
  EXPECT_EQ(rt.getattr(c, "p"), p);
}

TEST(Runtime, TypeOfAndBuiltins) {
  runtime rt;
  auto type_fn = rt.getattr(rt.builtins(), "type");
  EXPECT_EQ(rt.call(type_fn, {make_int(1)}), rt.getattr(rt.builtins(), "int"));
  auto none_type = rt.type_of(none());
  EXPECT_EQ(none_type->meta, type::special_singleton);
  EXPECT_EQ(rt.call(none_type, {}), none());
  EXPECT_FALSE(rt.try_getattr(rt.builtins(), "NoneType").has_value());
  EXPECT_EQ(rt.type_of(std::make_shared<lock>())->name, "lock");
}

TEST(Runtime, NewObjSkipsInit) {
  runtime rt;
  auto init = rt.make_native("__init__", [](runtime &, args_t &) -> ref {
    throw error::value_error("must not run");
  });
  auto c = rt.make_class("C", "C", "lib", {}, {{"__init__", init}});
  ref obj = rt.call(rt.getattr(rt.find_module("copyreg"), "__newobj__"), {c});
  EXPECT_EQ(rt.type_of(obj), c);
  EXPECT_THROW(rt.call(c, {}), error::value_error);
}

TEST(Runtime, EnumByValue) {
  runtime rt;
  auto e = rt.make_enum("Color", "Color", "lib", {{"RED", make_int(1)}, {"BLUE", make_int(3)}});
  EXPECT_EQ(rt.getattr(e, "BLUE"), e->members[1]);
  EXPECT_EQ(as<string>(rt.getattr(e->members[0], "name"))->v, "RED");
  EXPECT_THROW(rt.call(e, {make_int(2)}), error::value_error);
  EXPECT_THROW(add_enum_member(e, "RED", make_int(9)), error::value_error);
}

TEST(Runtime, FunctionAttributes) {
  runtime rt;
  auto co = std::make_shared<code>();
  co->name = "f";
  co->qualname = "f";
  auto f = rt.make_function(co, rt.main_module()->ns, "f");
  rt.setattr(f, "__qualname__", make_str("g"));
  rt.setattr(f, "tag", make_int(5));
  rt.setattr(f, "__module__", none());
  EXPECT_EQ(f->qualname, "g");
  EXPECT_EQ(as<integer>(f->attrs.at("tag"))->v, 5);
  EXPECT_FALSE(f->module.has_value());
  EXPECT_TRUE(is_none(rt.call(f, {})));
}

TEST(Runtime, Loggers) {
  runtime rt;
  EXPECT_EQ(rt.get_logger("a"), rt.get_logger("a"));
  EXPECT_TRUE(rt.get_logger("")->is_root());
  auto get_logger = rt.getattr(rt.builtins(), "getLogger");
  EXPECT_EQ(rt.call(get_logger, {}), rt.get_logger(""));
}

TEST(Runtime, DictViewsAndPartial) {
  runtime rt;
  auto d = std::make_shared<dict>();
  d->set("a", make_int(1));
  ref keys = rt.call(rt.getattr(d, "keys"), {});
  EXPECT_EQ(keys->kind(), kind_t::dict_keys);
  d->set("b", make_int(2));
  EXPECT_EQ(static_cast<dict_view &>(*keys).materialize().size(), 2);

  auto add = rt.make_native("add", [](runtime &, args_t &a) -> ref {
    return make_int(as<integer>(a.at(0))->v + as<integer>(a.at(1))->v);
  });
  ref p = rt.call(rt.getattr(rt.builtins(), "partial"), {add, make_int(40)});
  EXPECT_EQ(as<integer>(rt.call(p, {make_int(2)}))->v, 42);
}

}
