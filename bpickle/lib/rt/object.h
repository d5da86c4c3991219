#ifndef BPICKLE_LIB_RT_OBJECT_H_
#define BPICKLE_LIB_RT_OBJECT_H_

#include <util/util.h>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bpickle::rt {

enum class kind_t : uint8_t {
  none, ellipsis, not_implemented,
  boolean, integer, floating, string,
  tuple, list, dict,
  cell, code, function, native_function,
  type, instance, enum_member, module,
  bound_method, property, class_method, static_method, getset_descriptor,
  weak_set, lock, logger,
  dict_keys, dict_values, dict_items, mapping_proxy,
  stream, partial
};
std::string_view kind_to_string(kind_t k);

struct object;
typedef std::shared_ptr<object> ref;
typedef std::vector<ref> args_t;
typedef std::map<std::string, ref> attr_map;

class runtime;
struct code;
struct type;
struct cell;
struct dict;

namespace error {
class t : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};
struct attribute_error : public t { using t::t; };
struct type_error : public t { using t::t; };
struct name_error : public t { using t::t; };
struct import_error : public t { using t::t; };
struct value_error : public t { using t::t; };
}

struct object : public std::enable_shared_from_this<object> {
  virtual kind_t kind() const = 0;
  virtual ~object() = default;
  bool is(kind_t k) const { return kind() == k; }
};

template<typename T>
std::shared_ptr<T> as(const ref &o) {
  if (!o || o->kind() != T::static_kind)return nullptr;
  return std::static_pointer_cast<T>(o);
}

template<typename T>
std::shared_ptr<T> expect(const ref &o, std::string_view what) {
  auto p = as<T>(o);
  if (!p)throw error::type_error(std::string(what).append(" expected ").append(kind_to_string(T::static_kind)));
  return p;
}

#define BPICKLE_RT_KIND(k) static constexpr kind_t static_kind = kind_t::k; \
kind_t kind() const final { return static_kind; }

struct singleton : public object {
  kind_t k;
  explicit singleton(kind_t k) : k(k) {}
  kind_t kind() const final { return k; }
};

ref none();
ref ellipsis();
ref not_implemented();
bool is_none(const ref &o);

struct boolean : public object {
  BPICKLE_RT_KIND(boolean)
  const bool v;
  explicit boolean(bool v) : v(v) {}
};
ref make_bool(bool v);

struct integer : public object {
  BPICKLE_RT_KIND(integer)
  const int64_t v;
  explicit integer(int64_t v) : v(v) {}
};
ref make_int(int64_t v);

struct floating : public object {
  BPICKLE_RT_KIND(floating)
  const double v;
  explicit floating(double v) : v(v) {}
};

struct string : public object {
  BPICKLE_RT_KIND(string)
  const std::string v;
  explicit string(std::string v) : v(std::move(v)) {}
};
ref make_str(std::string_view v);

struct tuple : public object {
  BPICKLE_RT_KIND(tuple)
  std::vector<ref> items;
  tuple() = default;
  explicit tuple(std::vector<ref> items) : items(std::move(items)) {}
};
ref make_tuple(std::vector<ref> items);

struct list : public object {
  BPICKLE_RT_KIND(list)
  std::vector<ref> items;
  list() = default;
  explicit list(std::vector<ref> items) : items(std::move(items)) {}
};

// scalars compare by value, everything else by identity
bool same_key(const ref &a, const ref &b);

struct dict : public object {
  BPICKLE_RT_KIND(dict)
  std::vector<std::pair<ref, ref>> entries;
  [[nodiscard]] ref get(const ref &key) const;
  [[nodiscard]] ref get(std::string_view key) const;
  void set(ref key, ref value);
  void set(std::string_view key, ref value);
  bool erase(const ref &key);
  bool erase(std::string_view key);
  [[nodiscard]] bool contains(std::string_view key) const { return get(key) != nullptr; }
  [[nodiscard]] size_t size() const { return entries.size(); }
  void clear() { entries.clear(); }
};

struct cell : public object {
  BPICKLE_RT_KIND(cell)
  ref contents; // nullptr while empty
  cell() = default;
  explicit cell(ref c) : contents(std::move(c)) {}
  [[nodiscard]] bool empty() const { return contents == nullptr; }
};

struct function : public object {
  BPICKLE_RT_KIND(function)
  std::shared_ptr<code> co;
  std::shared_ptr<dict> globals;
  std::vector<std::shared_ptr<cell>> closure;
  std::vector<ref> defaults;
  std::string name, qualname;
  std::optional<std::string> module;
  ref doc;
  attr_map attrs;
  [[nodiscard]] bool is_coroutine() const;
};

struct native_function : public object {
  BPICKLE_RT_KIND(native_function)
  typedef std::function<ref(runtime &, args_t &)> impl_t;
  std::string name, qualname;
  std::optional<std::string> module;
  ref self; // owner of a builtin method, nullptr for free functions
  impl_t impl;
  native_function(std::string name, impl_t impl, std::optional<std::string> module = {})
      : name(name), qualname(std::move(name)), module(std::move(module)), impl(std::move(impl)) {}
};

struct enum_member;

struct type : public object {
  BPICKLE_RT_KIND(type)
  enum meta_t { plain_class, enumeration, special_singleton };
  meta_t meta = plain_class;
  std::string name, qualname, module;
  std::vector<std::shared_ptr<type>> bases;
  attr_map attrs;
  std::vector<std::shared_ptr<enum_member>> members; // declaration order, enumerations only
  std::optional<kind_t> builtin_kind; // set for the runtime's own types
  ref singleton_value;                 // special singletons only
  [[nodiscard]] ref lookup(std::string_view name) const;
  [[nodiscard]] bool is_subclass_of(const type &other) const;
  [[nodiscard]] std::shared_ptr<enum_member> member(std::string_view name) const;
};

struct instance : public object {
  BPICKLE_RT_KIND(instance)
  std::shared_ptr<type> cls;
  attr_map attrs;
  explicit instance(std::shared_ptr<type> cls) : cls(std::move(cls)) {}
};

struct enum_member : public object {
  BPICKLE_RT_KIND(enum_member)
  std::shared_ptr<type> cls;
  std::string name;
  ref value;
  enum_member(std::shared_ptr<type> cls, std::string name, ref value)
      : cls(std::move(cls)), name(std::move(name)), value(std::move(value)) {}
};

struct module : public object {
  BPICKLE_RT_KIND(module)
  enum origin_t { builtin, file, ad_hoc };
  std::string name;
  std::shared_ptr<dict> ns;
  origin_t origin;
  std::optional<std::string> path;
  // consulted when the namespace misses; may throw anything
  std::function<ref(std::string_view)> fallback_getattr;
  module(std::string name, origin_t origin);
  [[nodiscard]] ref lookup(std::string_view attr) const;
};

struct bound_method : public object {
  BPICKLE_RT_KIND(bound_method)
  ref func, self;
  bound_method(ref func, ref self) : func(std::move(func)), self(std::move(self)) {}
};

struct property : public object {
  BPICKLE_RT_KIND(property)
  ref fget, fset, fdel, doc;
};

struct class_method : public object {
  BPICKLE_RT_KIND(class_method)
  ref func;
  explicit class_method(ref f) : func(std::move(f)) {}
};

struct static_method : public object {
  BPICKLE_RT_KIND(static_method)
  ref func;
  explicit static_method(ref f) : func(std::move(f)) {}
};

struct getset_descriptor : public object {
  BPICKLE_RT_KIND(getset_descriptor)
  std::shared_ptr<type> owner;
  std::string name;
  getset_descriptor(std::shared_ptr<type> owner, std::string name) : owner(std::move(owner)), name(std::move(name)) {}
};

struct weak_set : public object {
  BPICKLE_RT_KIND(weak_set)
  std::vector<std::weak_ptr<object>> items;
  void add(const ref &o);
  [[nodiscard]] std::vector<ref> live() const;
};

struct lock : public object {
  BPICKLE_RT_KIND(lock)
  bool acquire(bool blocking = true);
  void release();
  [[nodiscard]] bool locked();
 private:
  std::mutex guard;
  std::condition_variable cv;
  bool held = false;
};

struct logger : public object {
  BPICKLE_RT_KIND(logger)
  std::string name; // empty for the root logger
  int level = 30;
  explicit logger(std::string name) : name(std::move(name)) {}
  [[nodiscard]] bool is_root() const { return name.empty(); }
};

struct dict_view : public object {
  kind_t k;
  std::shared_ptr<dict> d;
  dict_view(kind_t k, std::shared_ptr<dict> d) : k(k), d(std::move(d)) {}
  kind_t kind() const final { return k; }
  [[nodiscard]] std::vector<ref> materialize() const;
};

struct mapping_proxy : public object {
  BPICKLE_RT_KIND(mapping_proxy)
  std::shared_ptr<dict> d;
  explicit mapping_proxy(std::shared_ptr<dict> d) : d(std::move(d)) {}
};

struct stream : public object {
  BPICKLE_RT_KIND(stream)
  enum mode_t { read, write };
  std::string name;
  mode_t mode;
  std::string content;
  size_t pos = 0;
  bool closed = false;
  stream(std::string name, mode_t mode, std::string content = "")
      : name(std::move(name)), mode(mode), content(std::move(content)) {}
  [[nodiscard]] std::string_view remaining() const { return std::string_view(content).substr(pos); }
  std::string read_all();
  void write_text(std::string_view s);
};

struct partial : public object {
  BPICKLE_RT_KIND(partial)
  ref func;
  std::vector<ref> args;
  partial(ref func, std::vector<ref> args) : func(std::move(func)), args(std::move(args)) {}
};

// the name a definition is published under, if it has one
std::optional<std::string> qualname_of(const ref &o);
std::optional<std::string> declared_module_of(const ref &o);

std::string repr(const ref &o);
bool truthy(const ref &o);

}

#endif //BPICKLE_LIB_RT_OBJECT_H_
