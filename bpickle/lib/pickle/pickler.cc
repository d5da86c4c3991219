#include <pickle/pickler.h>

namespace bpickle::pickle {

std::optional<std::string> whichmodule(rt::runtime &rt, const rt::ref &obj, std::string_view qualname) {
  // lookups may run module hooks that load or drop modules
  const auto modules = rt.modules();
  for (const auto&[name, m] : modules) {
    if (name == rt::runtime::main_name)continue;
    try {
      if (rt.lookup_qualified(m, qualname) == obj)return name;
    } catch (const std::exception &) {
      continue;
    }
  }
  return {};
}

pickler::pickler(rt::runtime &rt) : rt(rt) {}

std::string pickler::dumps(const rt::ref &obj) {
  out = wire::writer();
  memo.clear();
  in_progress.clear();
  out.write_tag(wire::tag::proto);
  out.write_byte(wire::PROTOCOL);
  save(obj);
  out.write_tag(wire::tag::stop);
  memo.clear();
  return out.finish();
}

std::optional<reduce_value> pickler::reducer_override(const rt::ref &) {
  return {};
}

rt::ref pickler::builtin(std::string_view name) const {
  return rt.getattr(rt.builtins(), name);
}

void pickler::memoize(const rt::ref &obj) {
  const uint64_t id = memo.size();
  memo.emplace(obj.get(), std::make_pair(id, obj));
}

bool pickler::save_plain(const rt::ref &obj) {
  using rt::kind_t;
  switch (obj->kind()) {
    case kind_t::none:out.write_tag(wire::tag::none);
      return true;
    case kind_t::ellipsis:out.write_tag(wire::tag::ellipsis);
      return true;
    case kind_t::not_implemented:out.write_tag(wire::tag::not_implemented);
      return true;
    case kind_t::boolean:out.write_tag(rt::as<rt::boolean>(obj)->v ? wire::tag::true_ : wire::tag::false_);
      return true;
    case kind_t::integer:out.write_tag(wire::tag::integer);
      out.write_int64(rt::as<rt::integer>(obj)->v);
      return true;
    case kind_t::floating:out.write_tag(wire::tag::floating);
      out.write_double(rt::as<rt::floating>(obj)->v);
      return true;
    case kind_t::string:out.write_tag(wire::tag::string);
      out.write_string(rt::as<rt::string>(obj)->v);
      return true;
    default:return false;
  }
}

void pickler::save(const rt::ref &obj) {
  if (!obj) {
    out.write_tag(wire::tag::none);
    return;
  }
  if (save_plain(obj))return;
  if (auto it = memo.find(obj.get()); it != memo.end()) {
    out.write_tag(wire::tag::memo_get);
    out.write_uint64(it->second.first);
    return;
  }
  if (in_progress.contains(obj.get()))
    throw error::pickling_error("recursive reduction of " + rt::repr(obj) + " through its own constructor arguments");

  switch (obj->kind()) {
    case rt::kind_t::tuple:
    case rt::kind_t::list: {
      const bool is_tuple = obj->is(rt::kind_t::tuple);
      const auto &items = is_tuple ? rt::as<rt::tuple>(obj)->items : rt::as<rt::list>(obj)->items;
      out.write_tag(is_tuple ? wire::tag::tuple : wire::tag::list);
      memoize(obj);
      out.write_uint64(items.size());
      for (const rt::ref &i : items)save(i);
      return;
    }
    case rt::kind_t::dict: {
      auto d = rt::as<rt::dict>(obj);
      out.write_tag(wire::tag::dict);
      memoize(obj);
      out.write_uint64(d->entries.size());
      for (const auto&[k, v] : d->entries) {
        save(k);
        save(v);
      }
      return;
    }
    default:break;
  }

  if (auto rv = reducer_override(obj)) {
    save_reduce(obj, *rv);
    return;
  }
  if (auto it = dispatch_table.find(obj->kind()); it != dispatch_table.end()) {
    save_reduce(obj, it->second(obj));
    return;
  }

  switch (obj->kind()) {
    case rt::kind_t::type:
    case rt::kind_t::function:
    case rt::kind_t::native_function:save_global(obj);
      return;
    case rt::kind_t::enum_member: {
      auto m = rt::as<rt::enum_member>(obj);
      save_reduce(obj, {builtin("getattr"), {m->cls, rt::make_str(m->name)}, {}, nullptr});
      return;
    }
    case rt::kind_t::instance: {
      auto i = rt::as<rt::instance>(obj);
      reduce_value rv{rt.getattr(rt.import_module("copyreg"), "__newobj__"), {i->cls}, {}, nullptr};
      if (!i->attrs.empty()) {
        auto state = std::make_shared<rt::dict>();
        for (const auto&[k, v] : i->attrs)state->set(k, v);
        rv.state = state;
      }
      save_reduce(obj, rv);
      return;
    }
    default:
      throw error::unsupported_object(
          std::string("cannot pickle '").append(rt::kind_to_string(obj->kind())).append("' object: ")
              .append(rt::repr(obj)));
  }
}

void pickler::save_global(const rt::ref &obj) {
  auto name = rt::qualname_of(obj);
  if (!name)throw error::pickling_error("cannot pickle " + rt::repr(obj) + " by reference: it has no name");
  auto module_name = rt::declared_module_of(obj);
  if (!module_name)module_name = whichmodule(rt, obj, *name);
  if (!module_name)module_name = std::string(rt::runtime::main_name);
  rt::ref found;
  try {
    found = rt.lookup_qualified(rt.import_module(*module_name), *name);
  } catch (const rt::error::t &e) {
    throw error::pickling_error("cannot pickle " + rt::repr(obj) + ": it's not found as " + *module_name + "."
                                    + *name + " (" + e.what() + ")");
  }
  if (found != obj)
    throw error::pickling_error("cannot pickle " + rt::repr(obj) + ": it's not the same object as "
                                    + *module_name + "." + *name);
  out.write_tag(wire::tag::global);
  out.write_string(*module_name);
  out.write_string(*name);
  memoize(obj);
}

void pickler::save_reduce(const rt::ref &obj, const reduce_value &rv) {
  if (!rv.constructor)BPICKLE_THROW_INTERNAL_ERROR
  in_progress.insert(obj.get());
  out.write_tag(wire::tag::reduce);
  save(rv.constructor);
  out.write_uint64(rv.args.size());
  for (const rt::ref &a : rv.args)save(a);
  in_progress.erase(obj.get());
  memoize(obj);
  uint8_t flags = 0;
  if (rv.state)flags |= wire::HAS_STATE;
  if (rv.restore)flags |= wire::HAS_RESTORE;
  out.write_byte(flags);
  if (rv.state)save(*rv.state);
  if (rv.restore)save(rv.restore);
}

}
