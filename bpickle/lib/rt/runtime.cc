#include <rt/runtime.h>

namespace bpickle::rt {

namespace {

std::string_view str_arg(const args_t &args, size_t i, std::string_view fn) {
  if (i >= args.size())throw error::type_error(std::string(fn).append("() missing argument ").append(std::to_string(i)));
  auto s = as<string>(args[i]);
  if (!s)throw error::type_error(std::string(fn).append("() argument ").append(std::to_string(i)).append(" must be str"));
  return s->v;
}

void expect_arity(const args_t &args, size_t lo, size_t hi, std::string_view fn) {
  if (args.size() < lo || args.size() > hi)
    throw error::type_error(std::string(fn).append("() takes ").append(std::to_string(lo)).append(" to ")
                                .append(std::to_string(hi)).append(" arguments, ")
                                .append(std::to_string(args.size())).append(" given"));
}

std::shared_ptr<native_function> bound_native(const ref &self, std::string_view name, native_function::impl_t impl) {
  auto n = std::make_shared<native_function>(std::string(name), std::move(impl));
  n->self = self;
  return n;
}

}

std::shared_ptr<enum_member> add_enum_member(const std::shared_ptr<type> &t, std::string_view name, ref value) {
  if (t->meta != type::enumeration)throw error::type_error(t->qualname + " is not an enumeration");
  if (t->member(name))throw error::value_error(std::string("duplicate enum member ").append(name));
  auto m = std::make_shared<enum_member>(t, std::string(name), std::move(value));
  t->members.push_back(m);
  t->attrs[std::string(name)] = m;
  return m;
}

runtime::runtime() {
  install_builtins();
  install_copyreg();
  main_ = add_module(main_name, module::ad_hoc);
}

std::shared_ptr<module> runtime::find_module(std::string_view name) const {
  auto it = modules_.find(name);
  return it == modules_.end() ? nullptr : it->second;
}

std::shared_ptr<module> runtime::add_module(std::string_view name, module::origin_t origin) {
  auto m = std::make_shared<module>(std::string(name), origin);
  if (origin == module::file)m->path = std::string(name) + ".basm";
  modules_[std::string(name)] = m;
  return m;
}

void runtime::remove_module(std::string_view name) {
  auto it = modules_.find(name);
  if (it != modules_.end())modules_.erase(it);
}

void runtime::register_loader(std::string_view name, loader_t loader, module::origin_t origin) {
  loaders_[std::string(name)] = {std::move(loader), origin};
}

bool runtime::is_importable(std::string_view name) const {
  return modules_.find(name) != modules_.end() || loaders_.find(name) != loaders_.end();
}

std::shared_ptr<module> runtime::import_module(std::string_view name) {
  if (auto m = find_module(name))return m;
  std::shared_ptr<module> parent;
  auto dot = name.rfind('.');
  if (dot != std::string_view::npos)parent = import_module(name.substr(0, dot));
  auto it = loaders_.find(name);
  if (it == loaders_.end())throw error::import_error(std::string("No module named '").append(name).append("'"));
  auto[loader, origin] = it->second;
  auto m = add_module(name, origin);
  try {
    loader(*this, *m);
  } catch (...) {
    remove_module(name);
    throw;
  }
  if (parent)parent->ns->set(name.substr(dot + 1), m);
  return m;
}

std::shared_ptr<module> runtime::exec_module(std::string_view name, const std::shared_ptr<code> &body,
                                             module::origin_t origin) {
  auto m = add_module(name, origin);
  try {
    exec_in(m, body);
  } catch (...) {
    remove_module(name);
    throw;
  }
  auto dot = name.rfind('.');
  if (dot != std::string_view::npos)
    if (auto parent = find_module(name.substr(0, dot)))parent->ns->set(name.substr(dot + 1), m);
  return m;
}

void runtime::exec_in(const std::shared_ptr<module> &m, const std::shared_ptr<code> &body) {
  if (!body->freevars.empty())throw error::value_error("module body cannot have free variables");
  auto f = make_function(body, m->ns, body->qualname);
  call(f, {});
}

ref runtime::lookup_qualified(const std::shared_ptr<module> &m, std::string_view qualname) {
  ref cur = m;
  for (std::string_view part : util::split_dotted(qualname)) {
    if (part == "<locals>")
      throw error::attribute_error(std::string("can't get local object ").append(qualname));
    cur = getattr(cur, part);
  }
  return cur;
}

std::shared_ptr<type> runtime::builtin_type(kind_t k) const {
  auto it = builtin_types_.find(k);
  if (it == builtin_types_.end())BPICKLE_THROW_INTERNAL_ERROR
  return it->second;
}

std::shared_ptr<type> runtime::type_of(const ref &o) const {
  if (!o)return builtin_type(kind_t::none);
  switch (o->kind()) {
    case kind_t::instance:return as<instance>(o)->cls;
    case kind_t::enum_member:return as<enum_member>(o)->cls;
    default:return builtin_type(o->kind());
  }
}

std::optional<ref> runtime::try_getattr(const ref &o, std::string_view name) {
  try {
    return getattr(o, name);
  } catch (const error::attribute_error &) {
    return {};
  }
}

ref runtime::bind_method(const ref &descriptor, const ref &self, const std::shared_ptr<type> &cls) {
  if (!descriptor)return nullptr;
  switch (descriptor->kind()) {
    case kind_t::function:
      if (self)return std::make_shared<bound_method>(descriptor, self);
      return descriptor;
    case kind_t::class_method:return std::make_shared<bound_method>(as<class_method>(descriptor)->func, cls);
    case kind_t::static_method:return as<static_method>(descriptor)->func;
    case kind_t::property:
      if (self) {
        auto p = as<property>(descriptor);
        if (is_none(p->fget))throw error::attribute_error("unreadable attribute");
        return call(p->fget, {self});
      }
      return descriptor;
    default:return descriptor;
  }
}

ref runtime::getattr(const ref &o, std::string_view name) {
  auto missing = [&]() -> error::attribute_error {
    return error::attribute_error(
        repr(o).append(" has no attribute '").append(name).append("'"));
  };
  if (!o)throw missing();
  switch (o->kind()) {
    case kind_t::module: {
      auto m = as<module>(o);
      if (ref r = m->lookup(name))return r;
      throw error::attribute_error(std::string("module '").append(m->name).append("' has no attribute '")
                                       .append(name).append("'"));
    }
    case kind_t::type: {
      auto t = as<type>(o);
      if (name == "__name__")return make_str(t->name);
      if (name == "__qualname__")return make_str(t->qualname);
      if (name == "__module__")return make_str(t->module);
      if (ref r = bind_method(t->lookup(name), nullptr, t))return r;
      break;
    }
    case kind_t::instance: {
      auto i = as<instance>(o);
      if (name == "__class__")return i->cls;
      if (auto it = i->attrs.find(std::string(name)); it != i->attrs.end())return it->second;
      if (ref r = bind_method(i->cls->lookup(name), o, i->cls))return r;
      break;
    }
    case kind_t::enum_member: {
      auto m = as<enum_member>(o);
      if (name == "name")return make_str(m->name);
      if (name == "value")return m->value;
      if (name == "__class__")return m->cls;
      if (ref r = bind_method(m->cls->lookup(name), o, m->cls))return r;
      break;
    }
    case kind_t::function: {
      auto f = as<function>(o);
      if (name == "__name__")return make_str(f->name);
      if (name == "__qualname__")return make_str(f->qualname);
      if (name == "__module__")return f->module ? make_str(*f->module) : none();
      if (name == "__doc__")return f->doc ? f->doc : none();
      if (name == "__code__")return f->co;
      if (name == "__globals__")return f->globals;
      if (name == "__defaults__")return make_tuple(f->defaults);
      if (auto it = f->attrs.find(std::string(name)); it != f->attrs.end())return it->second;
      break;
    }
    case kind_t::native_function: {
      auto f = as<native_function>(o);
      if (name == "__name__")return make_str(f->name);
      if (name == "__qualname__")return make_str(f->qualname);
      if (name == "__module__")return f->module ? make_str(*f->module) : none();
      if (name == "__self__")return f->self ? f->self : none();
      break;
    }
    case kind_t::bound_method: {
      auto b = as<bound_method>(o);
      if (name == "__func__")return b->func;
      if (name == "__self__")return b->self;
      return getattr(b->func, name);
    }
    case kind_t::class_method:
      if (name == "__func__")return as<class_method>(o)->func;
      break;
    case kind_t::static_method:
      if (name == "__func__")return as<static_method>(o)->func;
      break;
    case kind_t::property: {
      auto p = as<property>(o);
      if (name == "fget")return p->fget ? p->fget : none();
      if (name == "fset")return p->fset ? p->fset : none();
      if (name == "fdel")return p->fdel ? p->fdel : none();
      if (name == "__doc__")return p->doc ? p->doc : none();
      break;
    }
    case kind_t::getset_descriptor: {
      auto g = as<getset_descriptor>(o);
      if (name == "__name__")return make_str(g->name);
      if (name == "__objclass__")return g->owner;
      break;
    }
    case kind_t::cell: {
      auto c = as<cell>(o);
      if (name == "cell_contents") {
        if (c->empty())throw error::value_error("Cell is empty");
        return c->contents;
      }
      break;
    }
    case kind_t::code: {
      auto c = as<code>(o);
      if (name == "co_name")return make_str(c->name);
      if (name == "co_qualname")return make_str(c->qualname);
      if (name == "co_filename")return make_str(c->filename);
      if (name == "co_argcount")return make_int(c->argcount);
      break;
    }
    case kind_t::dict: {
      auto d = as<dict>(o);
      if (name == "keys" || name == "values" || name == "items") {
        kind_t k = name == "keys" ? kind_t::dict_keys : name == "values" ? kind_t::dict_values : kind_t::dict_items;
        return bound_native(o, name, [k](runtime &, args_t &a) -> ref {
          return std::make_shared<dict_view>(k, as<dict>(a.at(0)));
        });
      }
      if (name == "get")
        return bound_native(o, name, [](runtime &, args_t &a) -> ref {
          expect_arity(a, 2, 3, "get");
          ref r = as<dict>(a[0])->get(a[1]);
          return r ? r : (a.size() == 3 ? a[2] : none());
        });
      break;
    }
    case kind_t::stream: {
      auto s = as<stream>(o);
      if (name == "name")return make_str(s->name);
      if (name == "mode")return make_str(s->mode == stream::read ? "r" : "w");
      if (name == "closed")return make_bool(s->closed);
      if (name == "read")
        return bound_native(o, name, [](runtime &, args_t &a) -> ref {
          return make_str(as<stream>(a.at(0))->read_all());
        });
      if (name == "write")
        return bound_native(o, name, [](runtime &, args_t &a) -> ref {
          expect_arity(a, 2, 2, "write");
          auto text = str_arg(a, 1, "write");
          as<stream>(a[0])->write_text(text);
          return make_int(int64_t(text.size()));
        });
      if (name == "close")
        return bound_native(o, name, [](runtime &, args_t &a) -> ref {
          as<stream>(a.at(0))->closed = true;
          return none();
        });
      break;
    }
    case kind_t::lock: {
      if (name == "acquire")
        return bound_native(o, name, [](runtime &, args_t &a) -> ref {
          expect_arity(a, 1, 2, "acquire");
          return make_bool(as<lock>(a[0])->acquire(a.size() == 1 || truthy(a[1])));
        });
      if (name == "release")
        return bound_native(o, name, [](runtime &, args_t &a) -> ref {
          as<lock>(a.at(0))->release();
          return none();
        });
      if (name == "locked")
        return bound_native(o, name, [](runtime &, args_t &a) -> ref {
          return make_bool(as<lock>(a.at(0))->locked());
        });
      break;
    }
    case kind_t::logger: {
      auto l = as<logger>(o);
      if (name == "name")return make_str(l->is_root() ? "root" : l->name);
      if (name == "level")return make_int(l->level);
      break;
    }
    case kind_t::partial: {
      auto p = as<partial>(o);
      if (name == "func")return p->func;
      if (name == "args")return make_tuple(p->args);
      break;
    }
    case kind_t::mapping_proxy: {
      if (name == "keys" || name == "values" || name == "items")
        return getattr(as<mapping_proxy>(o)->d, name);
      break;
    }
    default:break;
  }
  throw missing();
}

void runtime::setattr(const ref &o, std::string_view name, ref value) {
  if (!o)throw error::attribute_error("cannot set attribute on null");
  switch (o->kind()) {
    case kind_t::instance:as<instance>(o)->attrs[std::string(name)] = std::move(value);
      return;
    case kind_t::type: {
      auto t = as<type>(o);
      if (t->builtin_kind)throw error::type_error("cannot set attributes of builtin type " + t->name);
      if (name == "__module__")t->module = expect<string>(value, "__module__")->v;
      else if (name == "__qualname__")t->qualname = expect<string>(value, "__qualname__")->v;
      else t->attrs[std::string(name)] = std::move(value);
      return;
    }
    case kind_t::module:as<module>(o)->ns->set(name, std::move(value));
      return;
    case kind_t::function: {
      auto f = as<function>(o);
      if (name == "__name__")f->name = expect<string>(value, "__name__")->v;
      else if (name == "__qualname__")f->qualname = expect<string>(value, "__qualname__")->v;
      else if (name == "__module__")
        f->module = is_none(value) ? std::nullopt : std::optional<std::string>(expect<string>(value, "__module__")->v);
      else if (name == "__doc__")f->doc = std::move(value);
      else if (name == "__defaults__") {
        auto d = expect<tuple>(value, "__defaults__");
        if (f->co && d->items.size() > f->co->argcount)
          throw error::value_error(f->qualname + " has more defaults than arguments");
        f->defaults = d->items;
      } else f->attrs[std::string(name)] = std::move(value);
      return;
    }
    case kind_t::cell:as<cell>(o)->contents = std::move(value);
      return;
    case kind_t::logger:
      if (name == "level") {
        as<logger>(o)->level = int(expect<integer>(value, "level")->v);
        return;
      }
      break;
    default:break;
  }
  throw error::attribute_error(repr(o).append(" has no writable attribute '").append(name).append("'"));
}

ref runtime::call_type(const std::shared_ptr<type> &t, args_t &args) {
  switch (t->meta) {
    case type::special_singleton:expect_arity(args, 0, 0, t->name);
      return t->singleton_value;
    case type::enumeration: {
      expect_arity(args, 1, 1, t->name);
      for (const auto &m : t->members)if (same_key(m->value, args[0]))return m;
      throw error::value_error(repr(args[0]) + " is not a valid " + t->qualname);
    }
    case type::plain_class:break;
  }
  if (t->builtin_kind) {
    switch (*t->builtin_kind) {
      case kind_t::type:expect_arity(args, 1, 1, "type");
        return type_of(args[0]);
      case kind_t::integer:
        expect_arity(args, 0, 1, "int");
        if (args.empty())return make_int(0);
        if (auto i = as<integer>(args[0]))return i;
        if (auto s = as<string>(args[0])) {
          try {
            return make_int(std::stoll(s->v));
          } catch (const std::logic_error &) {
            throw error::value_error("invalid literal for int(): " + repr(s));
          }
        }
        if (auto b = as<boolean>(args[0]))return make_int(b->v);
        throw error::type_error("int() argument must be a string or a number");
      case kind_t::string:
        expect_arity(args, 0, 1, "str");
        if (args.empty())return make_str("");
        if (auto s = as<string>(args[0]))return s;
        return make_str(repr(args[0]));
      case kind_t::tuple:
        expect_arity(args, 0, 1, "tuple");
        if (args.empty())return make_tuple({});
        if (auto l = as<list>(args[0]))return make_tuple(l->items);
        if (auto tu = as<tuple>(args[0]))return tu;
        throw error::type_error("tuple() argument must be a sequence");
      case kind_t::list:
        expect_arity(args, 0, 1, "list");
        if (args.empty())return std::make_shared<list>();
        if (auto tu = as<tuple>(args[0]))return std::make_shared<list>(tu->items);
        if (auto l = as<list>(args[0]))return std::make_shared<list>(l->items);
        throw error::type_error("list() argument must be a sequence");
      case kind_t::dict:expect_arity(args, 0, 0, "dict");
        return std::make_shared<dict>();
      case kind_t::instance:expect_arity(args, 0, 0, "object");
        return std::make_shared<instance>(t);
      default:throw error::type_error("cannot create '" + t->name + "' instances");
    }
  }
  auto obj = std::make_shared<instance>(t);
  if (ref init = t->lookup("__init__")) {
    args.insert(args.begin(), obj);
    call(init, std::move(args));
  } else if (!args.empty()) {
    throw error::type_error(t->qualname + "() takes no arguments");
  }
  return obj;
}

ref runtime::call(const ref &callable, args_t args) {
  if (!callable)throw error::type_error("null is not callable");
  switch (callable->kind()) {
    case kind_t::function:return run_frame(*as<function>(callable), args);
    case kind_t::native_function: {
      auto n = as<native_function>(callable);
      if (n->self)args.insert(args.begin(), n->self);
      return n->impl(*this, args);
    }
    case kind_t::bound_method: {
      auto b = as<bound_method>(callable);
      args.insert(args.begin(), b->self);
      return call(b->func, std::move(args));
    }
    case kind_t::type:return call_type(as<type>(callable), args);
    case kind_t::partial: {
      auto p = as<partial>(callable);
      args.insert(args.begin(), p->args.begin(), p->args.end());
      return call(p->func, std::move(args));
    }
    default:throw error::type_error("'" + std::string(kind_to_string(callable->kind())) + "' object is not callable");
  }
}

std::shared_ptr<logger> runtime::get_logger(std::string_view name) {
  auto it = loggers_.find(name);
  if (it != loggers_.end())return it->second;
  auto l = std::make_shared<logger>(std::string(name));
  loggers_[std::string(name)] = l;
  return l;
}

std::shared_ptr<type> runtime::make_class(std::string_view name, std::string_view qualname, std::string_view module,
                                          std::vector<std::shared_ptr<type>> bases, attr_map attrs) {
  auto t = std::make_shared<type>();
  t->meta = type::plain_class;
  t->name = name;
  t->qualname = qualname;
  t->module = module;
  t->bases = std::move(bases);
  t->attrs = std::move(attrs);
  return t;
}

std::shared_ptr<type> runtime::make_enum(std::string_view name, std::string_view qualname, std::string_view module,
                                         const std::vector<std::pair<std::string, ref>> &members) {
  auto t = make_class(name, qualname, module);
  t->meta = type::enumeration;
  for (const auto&[n, v] : members)add_enum_member(t, n, v);
  return t;
}

std::shared_ptr<function> runtime::make_function(const std::shared_ptr<code> &co, const std::shared_ptr<dict> &globals,
                                                 std::string_view qualname,
                                                 std::vector<std::shared_ptr<cell>> closure,
                                                 std::vector<ref> defaults) {
  if (closure.size() != co->freevars.size())
    throw error::value_error(co->qualname + " requires closure of length " + std::to_string(co->freevars.size())
                                 + ", not " + std::to_string(closure.size()));
  if (defaults.size() > co->argcount)throw error::value_error(co->qualname + " has more defaults than arguments");
  auto f = std::make_shared<function>();
  f->co = co;
  f->globals = globals;
  f->closure = std::move(closure);
  f->defaults = std::move(defaults);
  f->name = co->name;
  f->qualname = qualname;
  if (auto n = as<string>(globals->get("__name__")))f->module = n->v;
  f->doc = none();
  return f;
}

std::shared_ptr<native_function> runtime::make_native(std::string_view name, native_function::impl_t impl,
                                                      const std::shared_ptr<module> &owner) {
  auto n = std::make_shared<native_function>(std::string(name), std::move(impl));
  if (owner) {
    n->module = owner->name;
    owner->ns->set(name, n);
  }
  return n;
}

void runtime::install_builtins() {
  builtins_ = add_module("builtins", module::builtin);
  auto add_type = [&](kind_t k, type::meta_t meta, bool publish) {
    auto t = std::make_shared<type>();
    t->meta = meta;
    t->name = t->qualname = kind_to_string(k);
    t->module = "builtins";
    t->builtin_kind = k;
    builtin_types_[k] = t;
    if (publish)builtins_->ns->set(t->name, t);
    return t;
  };
  add_type(kind_t::none, type::special_singleton, false)->singleton_value = none();
  add_type(kind_t::ellipsis, type::special_singleton, false)->singleton_value = ellipsis();
  add_type(kind_t::not_implemented, type::special_singleton, false)->singleton_value = not_implemented();
  for (kind_t k : {kind_t::boolean, kind_t::integer, kind_t::floating, kind_t::string, kind_t::tuple, kind_t::list,
                   kind_t::dict, kind_t::type, kind_t::instance})
    add_type(k, type::plain_class, true);
  for (kind_t k : {kind_t::property, kind_t::class_method, kind_t::static_method, kind_t::partial, kind_t::cell,
                   kind_t::code, kind_t::function, kind_t::native_function, kind_t::enum_member, kind_t::module,
                   kind_t::bound_method, kind_t::getset_descriptor, kind_t::weak_set, kind_t::lock, kind_t::logger,
                   kind_t::dict_keys, kind_t::dict_values, kind_t::dict_items, kind_t::mapping_proxy, kind_t::stream})
    add_type(k, type::plain_class, false);
  builtins_->ns->set("None", none());
  builtins_->ns->set("Ellipsis", ellipsis());
  builtins_->ns->set("NotImplemented", not_implemented());
  builtins_->ns->set("True", make_bool(true));
  builtins_->ns->set("False", make_bool(false));

  make_native("getattr", [](runtime &rt, args_t &a) -> ref {
    expect_arity(a, 2, 3, "getattr");
    auto name = str_arg(a, 1, "getattr");
    if (a.size() == 3) {
      auto r = rt.try_getattr(a[0], name);
      return r ? *r : a[2];
    }
    return rt.getattr(a[0], name);
  }, builtins_);
  make_native("setattr", [](runtime &rt, args_t &a) -> ref {
    expect_arity(a, 3, 3, "setattr");
    rt.setattr(a[0], str_arg(a, 1, "setattr"), a[2]);
    return none();
  }, builtins_);
  make_native("len", [](runtime &, args_t &a) -> ref {
    expect_arity(a, 1, 1, "len");
    switch (a[0]->kind()) {
      case kind_t::string:return make_int(int64_t(as<string>(a[0])->v.size()));
      case kind_t::tuple:return make_int(int64_t(as<tuple>(a[0])->items.size()));
      case kind_t::list:return make_int(int64_t(as<list>(a[0])->items.size()));
      case kind_t::dict:return make_int(int64_t(as<dict>(a[0])->size()));
      case kind_t::weak_set:return make_int(int64_t(as<weak_set>(a[0])->live().size()));
      default:throw error::type_error("object has no len()");
    }
  }, builtins_);
  make_native("repr", [](runtime &, args_t &a) -> ref {
    expect_arity(a, 1, 1, "repr");
    return make_str(repr(a[0]));
  }, builtins_);
  make_native("isinstance", [](runtime &rt, args_t &a) -> ref {
    expect_arity(a, 2, 2, "isinstance");
    return make_bool(rt.type_of(a[0])->is_subclass_of(*expect<type>(a[1], "isinstance")));
  }, builtins_);
  make_native("open", [](runtime &, args_t &a) -> ref {
    expect_arity(a, 2, 3, "open");
    auto mode = str_arg(a, 1, "open");
    if (mode == "r")
      return std::make_shared<stream>(std::string(str_arg(a, 0, "open")), stream::read,
                                      a.size() == 3 ? std::string(str_arg(a, 2, "open")) : "");
    if (mode == "w")return std::make_shared<stream>(std::string(str_arg(a, 0, "open")), stream::write);
    throw error::value_error(std::string("invalid mode: '").append(mode).append("'"));
  }, builtins_);
  auto set_type_ctor = [&](kind_t k, native_function::impl_t impl) {
    make_native(kind_to_string(k), std::move(impl), builtins_);
  };
  set_type_ctor(kind_t::property, [](runtime &, args_t &a) -> ref {
    expect_arity(a, 0, 4, "property");
    auto p = std::make_shared<property>();
    p->fget = a.size() > 0 ? a[0] : none();
    p->fset = a.size() > 1 ? a[1] : none();
    p->fdel = a.size() > 2 ? a[2] : none();
    p->doc = a.size() > 3 ? a[3] : none();
    return p;
  });
  set_type_ctor(kind_t::class_method, [](runtime &, args_t &a) -> ref {
    expect_arity(a, 1, 1, "classmethod");
    return std::make_shared<class_method>(a[0]);
  });
  set_type_ctor(kind_t::static_method, [](runtime &, args_t &a) -> ref {
    expect_arity(a, 1, 1, "staticmethod");
    return std::make_shared<static_method>(a[0]);
  });
  set_type_ctor(kind_t::partial, [](runtime &, args_t &a) -> ref {
    if (a.empty())throw error::type_error("partial() takes at least 1 argument");
    return std::make_shared<partial>(a[0], std::vector<ref>(a.begin() + 1, a.end()));
  });
  make_native("Lock", [](runtime &, args_t &a) -> ref {
    expect_arity(a, 0, 0, "Lock");
    return std::make_shared<lock>();
  }, builtins_);
  make_native("getLogger", [](runtime &rt, args_t &a) -> ref {
    expect_arity(a, 0, 1, "getLogger");
    if (a.empty() || is_none(a[0]))return rt.get_logger("");
    return rt.get_logger(str_arg(a, 0, "getLogger"));
  }, builtins_);
  make_native("WeakSet", [](runtime &, args_t &a) -> ref {
    expect_arity(a, 0, 1, "WeakSet");
    auto w = std::make_shared<weak_set>();
    if (!a.empty()) {
      auto items = expect<list>(a[0], "WeakSet");
      for (const ref &r : items->items)w->add(r);
    }
    return w;
  }, builtins_);
  make_native("mappingproxy", [](runtime &, args_t &a) -> ref {
    expect_arity(a, 1, 1, "mappingproxy");
    return std::make_shared<mapping_proxy>(expect<dict>(a[0], "mappingproxy"));
  }, builtins_);
}

void runtime::install_copyreg() {
  auto copyreg = add_module("copyreg", module::builtin);
  make_native("__newobj__", [](runtime &, args_t &a) -> ref {
    if (a.empty())throw error::type_error("__newobj__() missing class");
    auto t = expect<type>(a[0], "__newobj__");
    if (t->meta != type::plain_class || t->builtin_kind)
      throw error::type_error("__newobj__() cannot create " + t->qualname + " instances");
    return std::make_shared<instance>(t);
  }, copyreg);
}

}
