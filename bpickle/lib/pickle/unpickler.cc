#include <pickle/unpickler.h>

namespace bpickle::pickle {

unpickler::unpickler(rt::runtime &rt) : rt(rt) {}

rt::ref unpickler::loads(std::string_view data) {
  memo.clear();
  wire::reader in(data);
  if (in.read_tag() != wire::tag::proto)throw error::corruption("missing protocol header");
  if (const uint8_t p = in.read_byte(); p != wire::PROTOCOL)
    throw error::corruption("unsupported protocol " + std::to_string(p));
  rt::ref result = load(in);
  if (in.read_tag() != wire::tag::stop)
    throw error::corruption("expected STOP at offset " + std::to_string(in.position() - 1));
  if (!in.empty())throw error::corruption("trailing data after STOP");
  memo.clear();
  return result;
}

rt::ref unpickler::find_class(std::string_view module, std::string_view qualname) {
  std::shared_ptr<rt::module> m;
  try {
    m = rt.import_module(module);
  } catch (const rt::error::t &e) {
    throw error::corruption(std::string("unknown module ").append(module).append(": ").append(e.what()));
  }
  try {
    return rt.lookup_qualified(m, qualname);
  } catch (const rt::error::t &e) {
    throw error::corruption(std::string("cannot find ").append(module).append(".").append(qualname).append(": ")
                                .append(e.what()));
  }
}

uint64_t unpickler::read_count(wire::reader &in) {
  const uint64_t n = in.read_uint64();
  // every element takes at least one byte
  if (n > (1ull << 32))throw error::corruption("implausible element count " + std::to_string(n));
  return n;
}

rt::ref unpickler::load(wire::reader &in) {
  const wire::tag t = in.read_tag();
  switch (t) {
    case wire::tag::none:return rt::none();
    case wire::tag::ellipsis:return rt::ellipsis();
    case wire::tag::not_implemented:return rt::not_implemented();
    case wire::tag::true_:return rt::make_bool(true);
    case wire::tag::false_:return rt::make_bool(false);
    case wire::tag::integer:return rt::make_int(in.read_int64());
    case wire::tag::floating:return std::make_shared<rt::floating>(in.read_double());
    case wire::tag::string:return rt::make_str(in.read_string());
    case wire::tag::tuple:
    case wire::tag::list: {
      std::vector<rt::ref> *items;
      rt::ref container;
      if (t == wire::tag::tuple) {
        auto tu = std::make_shared<rt::tuple>();
        items = &tu->items;
        container = tu;
      } else {
        auto l = std::make_shared<rt::list>();
        items = &l->items;
        container = l;
      }
      memo.push_back(container);
      for (uint64_t n = read_count(in); n > 0; --n)items->push_back(load(in));
      return container;
    }
    case wire::tag::dict: {
      auto d = std::make_shared<rt::dict>();
      memo.push_back(d);
      for (uint64_t n = read_count(in); n > 0; --n) {
        rt::ref k = load(in);
        rt::ref v = load(in);
        d->set(std::move(k), std::move(v));
      }
      return d;
    }
    case wire::tag::global: {
      std::string module = in.read_string();
      std::string qualname = in.read_string();
      rt::ref r = find_class(module, qualname);
      memo.push_back(r);
      return r;
    }
    case wire::tag::reduce:return load_reduce(in);
    case wire::tag::memo_get: {
      const uint64_t id = in.read_uint64();
      if (id >= memo.size())throw error::corruption("memo reference " + std::to_string(id) + " is undefined");
      return memo[id];
    }
    case wire::tag::proto:
    case wire::tag::stop:break;
  }
  throw error::corruption(std::string("unexpected ").append(wire::tag_to_string(t)).append(" at offset ")
                              .append(std::to_string(in.position() - 1)));
}

rt::ref unpickler::load_reduce(wire::reader &in) {
  rt::ref ctor = load(in);
  std::vector<rt::ref> args;
  for (uint64_t n = read_count(in); n > 0; --n)args.push_back(load(in));
  rt::ref obj;
  try {
    obj = rt.call(ctor, std::move(args));
  } catch (const rt::error::t &e) {
    throw error::unpickling_error("calling " + rt::repr(ctor) + " failed: " + e.what());
  }
  memo.push_back(obj);
  const uint8_t flags = in.read_byte();
  if (flags & ~(wire::HAS_STATE | wire::HAS_RESTORE))throw error::corruption("invalid REDUCE flags");
  rt::ref state = flags & wire::HAS_STATE ? load(in) : nullptr;
  rt::ref restore = flags & wire::HAS_RESTORE ? load(in) : nullptr;
  if (flags & wire::HAS_STATE)apply_state(obj, state, restore);
  return obj;
}

void unpickler::apply_state(const rt::ref &obj, const rt::ref &state, const rt::ref &restore) {
  try {
    if (restore) {
      rt.call(restore, {obj, state});
      return;
    }
    if (rt::is_none(state))return;
    auto d = rt::as<rt::dict>(state);
    if (!d)throw error::corruption("cannot apply " + std::string(rt::kind_to_string(state->kind())) + " state to "
                                       + rt::repr(obj));
    for (const auto&[k, v] : d->entries)rt.setattr(obj, rt::expect<rt::string>(k, "attribute name")->v, v);
  } catch (const rt::error::t &e) {
    throw error::unpickling_error("restoring the state of " + rt::repr(obj) + " failed: " + e.what());
  }
}

}
