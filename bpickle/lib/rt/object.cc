#include <rt/object.h>
#include <rt/code.h>
#include <sstream>

namespace bpickle::rt {

std::string_view kind_to_string(kind_t k) {
  switch (k) {
    case kind_t::none:return "NoneType";
    case kind_t::ellipsis:return "ellipsis";
    case kind_t::not_implemented:return "NotImplementedType";
    case kind_t::boolean:return "bool";
    case kind_t::integer:return "int";
    case kind_t::floating:return "float";
    case kind_t::string:return "str";
    case kind_t::tuple:return "tuple";
    case kind_t::list:return "list";
    case kind_t::dict:return "dict";
    case kind_t::cell:return "cell";
    case kind_t::code:return "code";
    case kind_t::function:return "function";
    case kind_t::native_function:return "builtin_function_or_method";
    case kind_t::type:return "type";
    case kind_t::instance:return "object";
    case kind_t::enum_member:return "enum_member";
    case kind_t::module:return "module";
    case kind_t::bound_method:return "method";
    case kind_t::property:return "property";
    case kind_t::class_method:return "classmethod";
    case kind_t::static_method:return "staticmethod";
    case kind_t::getset_descriptor:return "getset_descriptor";
    case kind_t::weak_set:return "WeakSet";
    case kind_t::lock:return "lock";
    case kind_t::logger:return "Logger";
    case kind_t::dict_keys:return "dict_keys";
    case kind_t::dict_values:return "dict_values";
    case kind_t::dict_items:return "dict_items";
    case kind_t::mapping_proxy:return "mappingproxy";
    case kind_t::stream:return "TextIOWrapper";
    case kind_t::partial:return "partial";
  }
  BPICKLE_THROW_INTERNAL_ERROR
}

ref none() {
  static const ref n = std::make_shared<singleton>(kind_t::none);
  return n;
}
ref ellipsis() {
  static const ref e = std::make_shared<singleton>(kind_t::ellipsis);
  return e;
}
ref not_implemented() {
  static const ref ni = std::make_shared<singleton>(kind_t::not_implemented);
  return ni;
}
bool is_none(const ref &o) { return o == nullptr || o->is(kind_t::none); }

ref make_bool(bool v) {
  static const ref t = std::make_shared<boolean>(true), f = std::make_shared<boolean>(false);
  return v ? t : f;
}
ref make_int(int64_t v) { return std::make_shared<integer>(v); }
ref make_str(std::string_view v) { return std::make_shared<string>(std::string(v)); }
ref make_tuple(std::vector<ref> items) { return std::make_shared<tuple>(std::move(items)); }

bool same_key(const ref &a, const ref &b) {
  if (a == b)return true;
  if (!a || !b || a->kind() != b->kind())return false;
  switch (a->kind()) {
    case kind_t::boolean:return as<boolean>(a)->v == as<boolean>(b)->v;
    case kind_t::integer:return as<integer>(a)->v == as<integer>(b)->v;
    case kind_t::floating:return as<floating>(a)->v == as<floating>(b)->v;
    case kind_t::string:return as<string>(a)->v == as<string>(b)->v;
    case kind_t::tuple: {
      const auto &x = as<tuple>(a)->items, &y = as<tuple>(b)->items;
      if (x.size() != y.size())return false;
      for (size_t i = 0; i < x.size(); ++i)if (!same_key(x[i], y[i]))return false;
      return true;
    }
    default:return false;
  }
}

ref dict::get(const ref &key) const {
  for (const auto&[k, v] : entries)if (same_key(k, key))return v;
  return nullptr;
}
ref dict::get(std::string_view key) const {
  for (const auto&[k, v] : entries)
    if (auto s = as<string>(k); s && s->v == key)return v;
  return nullptr;
}
void dict::set(ref key, ref value) {
  for (auto&[k, v] : entries)
    if (same_key(k, key)) {
      v = std::move(value);
      return;
    }
  entries.emplace_back(std::move(key), std::move(value));
}
void dict::set(std::string_view key, ref value) {
  for (auto&[k, v] : entries)
    if (auto s = as<string>(k); s && s->v == key) {
      v = std::move(value);
      return;
    }
  entries.emplace_back(make_str(key), std::move(value));
}
bool dict::erase(const ref &key) {
  auto it = std::find_if(entries.begin(), entries.end(), [&](const auto &e) { return same_key(e.first, key); });
  if (it == entries.end())return false;
  entries.erase(it);
  return true;
}
bool dict::erase(std::string_view key) {
  auto it = std::find_if(entries.begin(), entries.end(), [&](const auto &e) {
    auto s = as<string>(e.first);
    return s && s->v == key;
  });
  if (it == entries.end())return false;
  entries.erase(it);
  return true;
}

bool function::is_coroutine() const {
  return co && (co->flags & code::FLAG_COROUTINE);
}

ref type::lookup(std::string_view n) const {
  if (auto it = attrs.find(std::string(n)); it != attrs.end())return it->second;
  for (const auto &b : bases)
    if (ref r = b->lookup(n))return r;
  return nullptr;
}

bool type::is_subclass_of(const type &other) const {
  if (this == &other)return true;
  return std::any_of(bases.begin(), bases.end(), [&](const auto &b) { return b->is_subclass_of(other); });
}

std::shared_ptr<enum_member> type::member(std::string_view n) const {
  for (const auto &m : members)if (m->name == n)return m;
  return nullptr;
}

module::module(std::string name, origin_t origin)
    : name(std::move(name)), ns(std::make_shared<dict>()), origin(origin) {
  ns->set("__name__", make_str(this->name));
}

ref module::lookup(std::string_view attr) const {
  if (ref r = ns->get(attr))return r;
  if (fallback_getattr)return fallback_getattr(attr);
  return nullptr;
}

void weak_set::add(const ref &o) {
  for (const auto &w : items)
    if (!w.owner_before(o) && !o.owner_before(w))return;
  items.emplace_back(o);
}

std::vector<ref> weak_set::live() const {
  std::vector<ref> v;
  for (const auto &w : items)
    if (ref r = w.lock())v.push_back(std::move(r));
  return v;
}

bool lock::acquire(bool blocking) {
  std::unique_lock<std::mutex> lk(guard);
  if (!blocking && held)return false;
  cv.wait(lk, [this] { return !held; });
  held = true;
  return true;
}

void lock::release() {
  {
    std::lock_guard<std::mutex> lk(guard);
    if (!held)throw error::value_error("release unlocked lock");
    held = false;
  }
  cv.notify_one();
}

bool lock::locked() {
  std::lock_guard<std::mutex> lk(guard);
  return held;
}

std::vector<ref> dict_view::materialize() const {
  std::vector<ref> v;
  for (const auto&[key, value] : d->entries) {
    switch (k) {
      case kind_t::dict_keys:v.push_back(key);
        break;
      case kind_t::dict_values:v.push_back(value);
        break;
      case kind_t::dict_items:v.push_back(make_tuple({key, value}));
        break;
      default:BPICKLE_THROW_INTERNAL_ERROR
    }
  }
  return v;
}

std::string stream::read_all() {
  if (closed)throw error::value_error("I/O operation on closed stream");
  if (mode != read)throw error::value_error("stream not readable");
  std::string s(remaining());
  pos = content.size();
  return s;
}

void stream::write_text(std::string_view s) {
  if (closed)throw error::value_error("I/O operation on closed stream");
  if (mode != write)throw error::value_error("stream not writable");
  content.append(s);
  pos = content.size();
}

std::optional<std::string> qualname_of(const ref &o) {
  if (!o)return {};
  switch (o->kind()) {
    case kind_t::function:return as<function>(o)->qualname;
    case kind_t::native_function:return as<native_function>(o)->qualname;
    case kind_t::type:return as<type>(o)->qualname;
    case kind_t::module:return as<module>(o)->name;
    default:return {};
  }
}

std::optional<std::string> declared_module_of(const ref &o) {
  if (!o)return {};
  switch (o->kind()) {
    case kind_t::function:return as<function>(o)->module;
    case kind_t::native_function:return as<native_function>(o)->module;
    case kind_t::type: {
      const auto &m = as<type>(o)->module;
      if (m.empty())return {};
      return m;
    }
    default:return {};
  }
}

std::string repr(const ref &o) {
  if (!o)return "<null>";
  std::stringstream ss;
  switch (o->kind()) {
    case kind_t::none:return "None";
    case kind_t::ellipsis:return "Ellipsis";
    case kind_t::not_implemented:return "NotImplemented";
    case kind_t::boolean:return as<boolean>(o)->v ? "True" : "False";
    case kind_t::integer:return std::to_string(as<integer>(o)->v);
    case kind_t::floating:ss << as<floating>(o)->v;
      return ss.str();
    case kind_t::string: {
      ss << '\'';
      for (char c : as<string>(o)->v) {
        if (util::chars::has_escaped_mnemonic(c))ss << '\\' << util::chars::escaped_mnemonic(c);
        else ss << c;
      }
      ss << '\'';
      return ss.str();
    }
    case kind_t::tuple:
    case kind_t::list: {
      const bool is_tuple = o->is(kind_t::tuple);
      const auto &items = is_tuple ? as<tuple>(o)->items : as<list>(o)->items;
      ss << (is_tuple ? "(" : "[");
      bool comma = false;
      for (const auto &i : items) {
        if (comma)ss << ", ";
        comma = true;
        ss << repr(i);
      }
      if (is_tuple && items.size() == 1)ss << ",";
      ss << (is_tuple ? ")" : "]");
      return ss.str();
    }
    case kind_t::dict: {
      ss << "{";
      bool comma = false;
      for (const auto&[k, v] : as<dict>(o)->entries) {
        if (comma)ss << ", ";
        comma = true;
        ss << repr(k) << ": " << repr(v);
      }
      ss << "}";
      return ss.str();
    }
    case kind_t::function:return "<function " + as<function>(o)->qualname + ">";
    case kind_t::native_function:return "<built-in function " + as<native_function>(o)->qualname + ">";
    case kind_t::type: {
      auto t = as<type>(o);
      return "<class '" + (t->module.empty() ? t->qualname : t->module + "." + t->qualname) + "'>";
    }
    case kind_t::instance: {
      auto t = as<instance>(o)->cls;
      return "<" + t->qualname + " object>";
    }
    case kind_t::enum_member: {
      auto m = as<enum_member>(o);
      return "<" + m->cls->name + "." + m->name + ": " + repr(m->value) + ">";
    }
    case kind_t::module:return "<module '" + as<module>(o)->name + "'>";
    case kind_t::stream:return "<stream name='" + as<stream>(o)->name + "'>";
    case kind_t::logger: {
      auto l = as<logger>(o);
      return "<Logger " + (l->is_root() ? std::string("root") : l->name) + ">";
    }
    default:return "<" + std::string(kind_to_string(o->kind())) + " object>";
  }
}

bool truthy(const ref &o) {
  if (is_none(o))return false;
  switch (o->kind()) {
    case kind_t::boolean:return as<boolean>(o)->v;
    case kind_t::integer:return as<integer>(o)->v != 0;
    case kind_t::floating:return as<floating>(o)->v != 0.0;
    case kind_t::string:return !as<string>(o)->v.empty();
    case kind_t::tuple:return !as<tuple>(o)->items.empty();
    case kind_t::list:return !as<list>(o)->items.empty();
    case kind_t::dict:return as<dict>(o)->size() != 0;
    default:return true;
  }
}

}
