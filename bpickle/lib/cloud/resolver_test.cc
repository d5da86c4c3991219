#include <gtest/gtest.h>
#include <cloud/resolver.h>
#include <rt/parse_asm.h>

namespace {
using namespace bpickle;
using cloud::decision;

constexpr std::string_view lib_src = R"(
.code <module>
  load_const @double
  load_const "double"
  make_function $0
  store_global double
  load_const @outer
  load_const "outer"
  make_function $0
  store_global outer
  load_const none
  return_value
.end

.code double
.args x
  load_fast x
  load_fast x
  binary_add
  return_value
.end

.code outer
  load_const @outer.<locals>.inner
  load_const "outer.<locals>.inner"
  make_function $0
  return_value
.end

.code outer.<locals>.inner
  load_const $1
  return_value
.end
)";

void load_lib(rt::runtime &rt, rt::module &m) {
  rt.exec_in(std::static_pointer_cast<rt::module>(m.shared_from_this()), rt::parse_asm::parse_module(lib_src));
}

rt::ref free_native(std::string_view name) {
  return std::make_shared<rt::native_function>(std::string(name), [](rt::runtime &, rt::args_t &) -> rt::ref {
    return rt::none();
  });
}

TEST(Resolver, ImportableDefinitionsByReference) {
  rt::runtime rt;
  rt.register_loader("lib", load_lib);
  auto lib = rt.import_module("lib");
  cloud::resolver r(rt);
  EXPECT_EQ(r.decide(rt.getattr(lib, "double")), decision::reference);
  EXPECT_EQ(r.decide(rt.getattr(rt.builtins(), "len")), decision::reference);
  EXPECT_EQ(r.decide(rt.builtin_type(rt::kind_t::integer)), decision::reference);
  EXPECT_EQ(r.decide_module(lib), decision::reference);

  // defined in a function body: the qualname does not resolve
  auto inner = rt.call(rt.getattr(lib, "outer"), {});
  EXPECT_EQ(r.decide(inner), decision::value);
  EXPECT_EQ(r.decide(rt::make_int(1)), decision::value);
}

TEST(Resolver, MainAndAdHocModulesByValue) {
  rt::runtime rt;
  cloud::resolver r(rt);
  auto c = rt.make_class("C", "C", rt::runtime::main_name);
  rt.main_module()->ns->set("C", c);
  EXPECT_EQ(r.decide(c), decision::value);

  // the declared module wins over a scan that would find the class elsewhere
  auto lib = rt.add_module("lib");
  lib->ns->set("C", c);
  EXPECT_EQ(r.owning_module(c, "C").value_or(""), "__main__");
  EXPECT_EQ(r.decide(c), decision::value);

  auto scratch = rt.add_module("scratch", rt::module::ad_hoc);
  auto helper = free_native("helper");
  scratch->ns->set("helper", helper);
  EXPECT_EQ(r.owning_module(helper, "helper").value_or(""), "scratch");
  EXPECT_EQ(r.decide(helper), decision::value);
  EXPECT_EQ(r.decide_module(scratch), decision::value);
  EXPECT_EQ(r.decide_module(rt.main_module()), decision::value);

  // published nowhere
  EXPECT_EQ(r.decide(free_native("orphan")), decision::value);
  auto unloaded = std::make_shared<rt::module>("unloaded", rt::module::file);
  EXPECT_EQ(r.decide_module(unloaded), decision::value);
}

TEST(Resolver, BrokenModuleDoesNotStopTheScan) {
  rt::runtime rt;
  auto broken = rt.add_module("a_broken");
  broken->fallback_getattr = [](std::string_view) -> rt::ref { throw std::runtime_error("lazy import failed"); };
  auto lib = rt.add_module("lib");
  auto helper = free_native("helper");
  lib->ns->set("helper", helper);
  cloud::resolver r(rt);
  EXPECT_EQ(r.owning_module(helper, "helper").value_or(""), "lib");
  EXPECT_EQ(r.decide(helper), decision::reference);
}

TEST(Resolver, RegisterByValueIsIdempotent) {
  rt::runtime rt;
  rt.register_loader("lib", load_lib);
  auto lib = rt.import_module("lib");
  auto f = rt.getattr(lib, "double");
  cloud::resolver r(rt);

  r.register_by_value(lib);
  r.register_by_value(lib);
  EXPECT_EQ(r.registered(), std::vector<std::string>{"lib"});
  EXPECT_EQ(r.decide(f), decision::value);
  EXPECT_EQ(r.decide_module(lib), decision::value);

  r.unregister_by_value(lib);
  EXPECT_TRUE(r.registered().empty());
  EXPECT_EQ(r.decide(f), decision::reference);
  EXPECT_THROW(r.unregister_by_value(lib), rt::error::value_error);
}

TEST(Resolver, RegisteredPackageCoversSubmodules) {
  rt::runtime rt;
  rt.register_loader("pkg", [](rt::runtime &, rt::module &) {});
  rt.register_loader("pkg.sub", [](rt::runtime &, rt::module &) {});
  auto sub = rt.import_module("pkg.sub");
  cloud::resolver r(rt);
  r.register_by_value(rt.find_module("pkg"));
  EXPECT_TRUE(r.is_registered_by_value("pkg.sub"));
  EXPECT_FALSE(r.is_registered_by_value("pkgx"));
  EXPECT_EQ(r.decide_module(sub), decision::value);
  // only the registered name can be unregistered
  EXPECT_THROW(r.unregister_by_value(sub), rt::error::value_error);
}

TEST(Resolver, RegistrationRejectsNonModules) {
  rt::runtime rt;
  cloud::resolver r(rt);
  EXPECT_THROW(r.register_by_value(rt::make_int(1)), rt::error::type_error);
  EXPECT_THROW(r.unregister_by_value(rt::make_str("lib")), rt::error::type_error);
  auto stray = std::make_shared<rt::module>("stray", rt::module::file);
  EXPECT_THROW(r.register_by_value(stray), rt::error::value_error);
}

}
