#include <cloud/resolver.h>
#include <pickle/pickler.h>

namespace bpickle::cloud {

std::string_view decision_to_string(decision d) {
  switch (d) {
    case decision::reference:return "reference";
    case decision::value:return "value";
  }
  BPICKLE_THROW_INTERNAL_ERROR
}

resolver::resolver(rt::runtime &rt) : rt(rt) {}

std::optional<std::string> resolver::owning_module(const rt::ref &obj, std::string_view name) const {
  if (auto t = rt::as<rt::type>(obj); t && t->module == rt::runtime::main_name)return t->module;
  if (auto m = rt::declared_module_of(obj))return m;
  return pickle::whichmodule(rt, obj, name);
}

decision resolver::decide(const rt::ref &obj, std::optional<std::string> name) const {
  if (!name)name = rt::qualname_of(obj);
  if (!name)return decision::value;
  const auto module_name = owning_module(obj, *name);
  if (!module_name || *module_name == rt::runtime::main_name)return decision::value;
  auto m = rt.find_module(*module_name);
  if (!m || m->origin == rt::module::ad_hoc)return decision::value;
  if (is_registered_by_value(*module_name))return decision::value;
  // a definition nested in a function body, or shadowed in its module, is not reachable by name
  try {
    if (rt.lookup_qualified(m, *name) != obj)return decision::value;
  } catch (const std::exception &) {
    return decision::value;
  }
  return decision::reference;
}

decision resolver::decide_module(const std::shared_ptr<rt::module> &m) const {
  if (m->origin == rt::module::ad_hoc || is_registered_by_value(m->name))return decision::value;
  if (rt.find_module(m->name) != m)return decision::value;
  return decision::reference;
}

void resolver::register_by_value(const rt::ref &module) {
  auto m = rt::as<rt::module>(module);
  if (!m)throw rt::error::type_error("input should be a module, got " + rt::repr(module));
  if (rt.find_module(m->name) != m)
    throw rt::error::value_error(rt::repr(module) + " was not imported correctly, import it before registering it");
  std::lock_guard<std::mutex> lk(mu);
  by_value.insert(m->name);
}

void resolver::unregister_by_value(const rt::ref &module) {
  auto m = rt::as<rt::module>(module);
  if (!m)throw rt::error::type_error("input should be a module, got " + rt::repr(module));
  std::lock_guard<std::mutex> lk(mu);
  if (by_value.erase(m->name) == 0)
    throw rt::error::value_error(rt::repr(module) + " is not registered for pickle by value");
}

bool resolver::is_registered_by_value(std::string_view module_name) const {
  std::lock_guard<std::mutex> lk(mu);
  for (std::string_view prefix = module_name;;) {
    if (by_value.contains(prefix))return true;
    const size_t dot = prefix.rfind('.');
    if (dot == std::string_view::npos)return false;
    prefix = prefix.substr(0, dot);
  }
}

std::vector<std::string> resolver::registered() const {
  std::lock_guard<std::mutex> lk(mu);
  return {by_value.begin(), by_value.end()};
}

}
