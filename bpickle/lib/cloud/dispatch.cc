#include <cloud/dispatch.h>
#include <cloud/cloud.h>
#include <cloud/reconstructors.h>

namespace bpickle::cloud {

using pickle::reduce_value;

rt::attr_map extract_class_dict(const rt::type &t) {
  rt::attr_map clsdict = t.attrs;
  if (t.bases.size() == 1) {
    const rt::attr_map &inherited = t.bases.front()->attrs;
    std::erase_if(clsdict, [&](const auto &entry) {
      auto it = inherited.find(entry.first);
      return it != inherited.end() && it->second == entry.second;
    });
  }
  return clsdict;
}

cloud_pickler::cloud_pickler(engine &e) : pickle::pickler(e.runtime()), e(e) {
  install_dispatch_table();
}

rt::ref cloud_pickler::reconstructor(std::string_view name) const {
  return rt.getattr(e.reconstructors(), name);
}

std::optional<reduce_value> cloud_pickler::reducer_override(const rt::ref &obj) {
  switch (obj->kind()) {
    case rt::kind_t::type:return class_reduce(rt::as<rt::type>(obj));
    case rt::kind_t::function:return function_reduce(rt::as<rt::function>(obj));
    case rt::kind_t::native_function:return native_function_reduce(rt::as<rt::native_function>(obj));
    default:return {};
  }
}

std::optional<reduce_value> cloud_pickler::class_reduce(const std::shared_ptr<rt::type> &t) {
  if (t->meta == rt::type::special_singleton)return reduce_value{builtin("type"), {t->singleton_value}, {}, nullptr};
  if (t->builtin_kind)return {};
  if (e.references().decide(t) == decision::reference)return {};
  return dynamic_class_reduce(t);
}

reduce_value cloud_pickler::dynamic_class_reduce(const std::shared_ptr<rt::type> &t) {
  const std::string id = e.tracker().get_or_create_id(t);
  e.note("pickling class " + t->qualname + " by value (" + id + ")");
  auto state = std::make_shared<rt::dict>();
  if (t->meta == rt::type::enumeration) {
    std::vector<rt::ref> members;
    for (const auto &m : t->members)members.push_back(rt::make_tuple({rt::make_str(m->name), m->value}));
    for (const auto&[k, v] : t->attrs)
      if (!t->member(k))state->set(k, v);
    return {reconstructor("make_skeleton_enum"),
            {rt::make_str(t->name), rt::make_str(t->qualname), rt::make_str(t->module),
             rt::make_tuple(std::move(members)), rt::make_str(id)},
            state, reconstructor("class_setstate")};
  }
  for (const auto&[k, v] : extract_class_dict(*t))state->set(k, v);
  return {reconstructor("make_skeleton_class"),
          {rt::make_str(t->name), rt::make_str(t->qualname), rt::make_str(t->module),
           rt::make_tuple(std::vector<rt::ref>(t->bases.begin(), t->bases.end())), rt::make_str(id)},
          state, reconstructor("class_setstate")};
}

std::optional<reduce_value> cloud_pickler::function_reduce(const std::shared_ptr<rt::function> &f) {
  if (f->is_coroutine())throw pickle::error::refused_by_policy("cannot pickle coroutine function " + rt::repr(f));
  if (e.references().decide(f) == decision::reference)return {};
  return dynamic_function_reduce(f);
}

std::shared_ptr<rt::dict> cloud_pickler::base_globals_for(const std::shared_ptr<rt::dict> &globals) {
  auto &base = base_globals[globals];
  if (!base) {
    base = std::make_shared<rt::dict>();
    if (globals)
      if (rt::ref name = globals->get("__name__"))base->set("__name__", name);
  }
  return base;
}

reduce_value cloud_pickler::dynamic_function_reduce(const std::shared_ptr<rt::function> &f) {
  e.note("pickling function " + f->qualname + " by value");
  return {reconstructor("make_function"),
          {f->co, base_globals_for(f->globals), rt::make_int(int64_t(f->closure.size()))},
          e.capsule().capture(f), reconstructor("function_setstate")};
}

std::optional<reduce_value> cloud_pickler::native_function_reduce(const std::shared_ptr<rt::native_function> &n) {
  if (e.references().decide(n) == decision::reference)return {};
  if (n->self)return reduce_value{builtin("getattr"), {n->self, rt::make_str(n->name)}, {}, nullptr};
  throw pickle::error::unsupported_object("cannot pickle native function " + rt::repr(n)
                                              + ": it is neither importable nor bound to an object");
}

void cloud_pickler::install_dispatch_table() {
  using rt::kind_t;

  dispatch_table[kind_t::property] = [this](const rt::ref &obj) {
    auto p = rt::as<rt::property>(obj);
    auto or_none = [](const rt::ref &r) { return r ? r : rt::none(); };
    return reduce_value{builtin("property"), {or_none(p->fget), or_none(p->fset), or_none(p->fdel), or_none(p->doc)},
                        {}, nullptr};
  };
  dispatch_table[kind_t::class_method] = [this](const rt::ref &obj) {
    return reduce_value{builtin("classmethod"), {rt::as<rt::class_method>(obj)->func}, {}, nullptr};
  };
  dispatch_table[kind_t::static_method] = [this](const rt::ref &obj) {
    return reduce_value{builtin("staticmethod"), {rt::as<rt::static_method>(obj)->func}, {}, nullptr};
  };
  dispatch_table[kind_t::getset_descriptor] = [this](const rt::ref &obj) {
    auto d = rt::as<rt::getset_descriptor>(obj);
    return reduce_value{builtin("getattr"), {d->owner, rt::make_str(d->name)}, {}, nullptr};
  };
  dispatch_table[kind_t::weak_set] = [this](const rt::ref &obj) {
    return reduce_value{builtin("WeakSet"), {std::make_shared<rt::list>(rt::as<rt::weak_set>(obj)->live())}, {},
                        nullptr};
  };
  dispatch_table[kind_t::lock] = [this](const rt::ref &obj) {
    return reduce_value{reconstructor("allocate_lock"), {rt::make_bool(rt::as<rt::lock>(obj)->locked())}, {},
                        nullptr};
  };
  dispatch_table[kind_t::logger] = [this](const rt::ref &obj) {
    auto l = rt::as<rt::logger>(obj);
    if (l->is_root())return reduce_value{builtin("getLogger"), {}, {}, nullptr};
    return reduce_value{builtin("getLogger"), {rt::make_str(l->name)}, {}, nullptr};
  };
  for (auto[k, view] : {std::pair{kind_t::dict_keys, "keys"}, std::pair{kind_t::dict_values, "values"},
                        std::pair{kind_t::dict_items, "items"}}) {
    dispatch_table[k] = [this, view](const rt::ref &obj) {
      auto v = std::static_pointer_cast<rt::dict_view>(obj);
      return reduce_value{reconstructor("make_dict_view"), {rt::make_str(view), v->d}, {}, nullptr};
    };
  }
  dispatch_table[kind_t::mapping_proxy] = [this](const rt::ref &obj) {
    return reduce_value{builtin("mappingproxy"), {rt::as<rt::mapping_proxy>(obj)->d}, {}, nullptr};
  };
  dispatch_table[kind_t::code] = [this](const rt::ref &obj) {
    auto co = rt::as<rt::code>(obj);
    auto strings = [](const std::vector<std::string> &v) {
      std::vector<rt::ref> items;
      for (const auto &s : v)items.push_back(rt::make_str(s));
      return rt::make_tuple(std::move(items));
    };
    return reduce_value{reconstructor("make_code"),
                        {rt::make_str(co->name), rt::make_str(co->qualname), rt::make_str(co->filename),
                         rt::make_int(co->first_line), rt::make_int(co->argcount), rt::make_int(co->flags),
                         rt::make_str(pack_instructions(co->instructions)), rt::make_tuple(co->consts),
                         strings(co->names), strings(co->varnames), strings(co->cellvars), strings(co->freevars)},
                        {}, nullptr};
  };
  dispatch_table[kind_t::cell] = [this](const rt::ref &obj) {
    auto c = rt::as<rt::cell>(obj);
    rt::ref contents = c->empty() ? rt.getattr(e.reconstructors(), EMPTY_CELL_VALUE) : c->contents;
    return reduce_value{reconstructor("make_empty_cell"), {}, contents, reconstructor("cell_set")};
  };
  dispatch_table[kind_t::module] = [this](const rt::ref &obj) {
    auto m = rt::as<rt::module>(obj);
    if (e.references().decide_module(m) == decision::reference)
      return reduce_value{reconstructor("subimport"), {rt::make_str(m->name)}, {}, nullptr};
    e.note("pickling module " + m->name + " by value");
    auto state = std::make_shared<rt::dict>();
    for (const auto&[k, v] : m->ns->entries)
      if (!rt::same_key(k, rt::make_str("__name__")))state->set(k, v);
    return reduce_value{reconstructor("dynamic_subimport"), {rt::make_str(m->name)}, state, nullptr};
  };
  dispatch_table[kind_t::bound_method] = [this](const rt::ref &obj) {
    auto b = rt::as<rt::bound_method>(obj);
    auto name = rt::qualname_of(b->func);
    if (auto f = rt::as<rt::function>(b->func))name = f->name;
    else if (auto n = rt::as<rt::native_function>(b->func))name = n->name;
    if (!name)throw pickle::error::unsupported_object("cannot pickle " + rt::repr(obj) + ": its function has no name");
    return reduce_value{builtin("getattr"), {b->self, rt::make_str(*name)}, {}, nullptr};
  };
  dispatch_table[kind_t::stream] = [this](const rt::ref &obj) {
    auto s = rt::as<rt::stream>(obj);
    if (s->closed)throw pickle::error::refused_by_policy("cannot pickle closed stream " + s->name);
    if (s->mode != rt::stream::read)
      throw pickle::error::refused_by_policy("cannot pickle stream " + s->name + ": only read mode is supported");
    return reduce_value{builtin("open"), {rt::make_str(s->name), rt::make_str("r"), rt::make_str(s->remaining())},
                        {}, nullptr};
  };
  dispatch_table[kind_t::partial] = [this](const rt::ref &obj) {
    auto p = rt::as<rt::partial>(obj);
    std::vector<rt::ref> args{p->func};
    args.insert(args.end(), p->args.begin(), p->args.end());
    return reduce_value{builtin("partial"), std::move(args), {}, nullptr};
  };
}

}
