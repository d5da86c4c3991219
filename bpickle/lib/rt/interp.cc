#include <rt/runtime.h>

namespace bpickle::rt {

namespace {

constexpr size_t max_depth = 256;

struct depth_guard {
  size_t &d;
  explicit depth_guard(size_t &d) : d(d) {
    if (++d > max_depth) {
      --d;
      throw error::t("maximum recursion depth exceeded");
    }
  }
  ~depth_guard() { --d; }
};

std::optional<double> as_number(const ref &o) {
  if (auto i = as<integer>(o))return double(i->v);
  if (auto f = as<floating>(o))return f->v;
  if (auto b = as<boolean>(o))return double(b->v);
  return {};
}

ref arith(opcode op, const ref &a, const ref &b) {
  auto ia = as<integer>(a), ib = as<integer>(b);
  if (ia && ib) {
    switch (op) {
      case opcode::binary_add:return make_int(ia->v + ib->v);
      case opcode::binary_sub:return make_int(ia->v - ib->v);
      case opcode::binary_mul:return make_int(ia->v * ib->v);
      default:BPICKLE_THROW_INTERNAL_ERROR
    }
  }
  auto na = as_number(a), nb = as_number(b);
  if (na && nb) {
    switch (op) {
      case opcode::binary_add:return std::make_shared<floating>(*na + *nb);
      case opcode::binary_sub:return std::make_shared<floating>(*na - *nb);
      case opcode::binary_mul:return std::make_shared<floating>(*na * *nb);
      default:BPICKLE_THROW_INTERNAL_ERROR
    }
  }
  if (op == opcode::binary_add) {
    if (auto sa = as<string>(a), sb = as<string>(b); sa && sb)return make_str(sa->v + sb->v);
    if (auto ta = as<tuple>(a), tb = as<tuple>(b); ta && tb) {
      std::vector<ref> v = ta->items;
      v.insert(v.end(), tb->items.begin(), tb->items.end());
      return make_tuple(std::move(v));
    }
    if (auto la = as<list>(a), lb = as<list>(b); la && lb) {
      std::vector<ref> v = la->items;
      v.insert(v.end(), lb->items.begin(), lb->items.end());
      return std::make_shared<list>(std::move(v));
    }
  }
  throw error::type_error(std::string("unsupported operand types for ").append(opcode_to_string(op)).append(": ")
                              .append(kind_to_string(a->kind())).append(" and ").append(kind_to_string(b->kind())));
}

bool equal(const ref &a, const ref &b) {
  if (same_key(a, b))return true;
  auto na = as_number(a), nb = as_number(b);
  if (na && nb)return *na == *nb;
  if (auto la = as<list>(a), lb = as<list>(b); la && lb) {
    if (la->items.size() != lb->items.size())return false;
    for (size_t i = 0; i < la->items.size(); ++i)if (!equal(la->items[i], lb->items[i]))return false;
    return true;
  }
  return false;
}

bool less(const ref &a, const ref &b) {
  auto na = as_number(a), nb = as_number(b);
  if (na && nb)return *na < *nb;
  if (auto sa = as<string>(a), sb = as<string>(b); sa && sb)return sa->v < sb->v;
  throw error::type_error(std::string("'<' not supported between ").append(kind_to_string(a->kind())).append(" and ")
                              .append(kind_to_string(b->kind())));
}

std::string top_level(std::string_view dotted) {
  return std::string(dotted.substr(0, dotted.find('.')));
}

}

ref runtime::run_frame(const function &f, args_t &args) {
  depth_guard guard(depth_);
  const code &co = *f.co;
  const size_t required = co.argcount - f.defaults.size();
  if (args.size() < required || args.size() > co.argcount)
    throw error::type_error(f.qualname + "() takes " + std::to_string(co.argcount) + " arguments but "
                                + std::to_string(args.size()) + " were given");
  if (f.closure.size() != co.freevars.size())
    throw error::value_error(f.qualname + "() has a closure of the wrong size");

  std::vector<ref> locals(co.varnames.size());
  for (size_t i = 0; i < co.argcount; ++i)locals[i] = i < args.size() ? args[i] : f.defaults[i - required];

  std::vector<std::shared_ptr<cell>> cells;
  cells.reserve(co.n_cells());
  for (const std::string &cv : co.cellvars) {
    auto c = std::make_shared<cell>();
    auto it = std::find(co.varnames.begin(), co.varnames.begin() + co.argcount, cv);
    if (it != co.varnames.begin() + co.argcount)c->contents = locals[std::distance(co.varnames.begin(), it)];
    cells.push_back(std::move(c));
  }
  cells.insert(cells.end(), f.closure.begin(), f.closure.end());

  std::vector<ref> stack;
  auto pop = [&]() -> ref {
    if (stack.empty())throw error::value_error(co.qualname + ": stack underflow");
    ref r = std::move(stack.back());
    stack.pop_back();
    return r;
  };
  auto pop_n = [&](size_t n) -> std::vector<ref> {
    if (stack.size() < n)throw error::value_error(co.qualname + ": stack underflow");
    std::vector<ref> v(std::make_move_iterator(stack.end() - n), std::make_move_iterator(stack.end()));
    stack.resize(stack.size() - n);
    return v;
  };
  auto module_name = [&]() -> std::string {
    if (auto s = as<string>(f.globals->get("__name__")))return s->v;
    return "";
  };

  for (size_t pc = 0; pc < co.instructions.size();) {
    const instruction &i = co.instructions[pc++];
    switch (i.op) {
      case opcode::nop:break;
      case opcode::load_const:stack.push_back(co.consts.at(i.arg));
        break;
      case opcode::load_fast: {
        ref v = locals.at(i.arg);
        if (!v)throw error::name_error("local variable '" + co.varnames[i.arg] + "' referenced before assignment");
        stack.push_back(std::move(v));
        break;
      }
      case opcode::store_fast:locals.at(i.arg) = pop();
        break;
      case opcode::load_global: {
        const std::string &n = co.names.at(i.arg);
        ref v = f.globals->get(n);
        if (!v)v = builtins_->ns->get(n);
        if (!v)throw error::name_error("name '" + n + "' is not defined");
        stack.push_back(std::move(v));
        break;
      }
      case opcode::store_global:f.globals->set(co.names.at(i.arg), pop());
        break;
      case opcode::delete_global:
        if (!f.globals->erase(co.names.at(i.arg)))
          throw error::name_error("name '" + co.names[i.arg] + "' is not defined");
        break;
      case opcode::load_deref: {
        const auto &c = cells.at(i.arg);
        if (c->empty()) {
          const std::string &n = i.arg < co.cellvars.size() ? co.cellvars[i.arg]
                                                             : co.freevars[i.arg - co.cellvars.size()];
          throw error::name_error("free variable '" + n + "' referenced before assignment");
        }
        stack.push_back(c->contents);
        break;
      }
      case opcode::store_deref:cells.at(i.arg)->contents = pop();
        break;
      case opcode::load_closure:stack.push_back(cells.at(i.arg));
        break;
      case opcode::load_attr: {
        ref o = pop();
        stack.push_back(getattr(o, co.names.at(i.arg)));
        break;
      }
      case opcode::store_attr: {
        ref o = pop();
        ref v = pop();
        setattr(o, co.names.at(i.arg), std::move(v));
        break;
      }
      case opcode::import_name: {
        const std::string &n = co.names.at(i.arg);
        import_module(n);
        stack.push_back(import_module(top_level(n)));
        break;
      }
      case opcode::binary_add:
      case opcode::binary_sub:
      case opcode::binary_mul: {
        ref b = pop();
        ref a = pop();
        stack.push_back(arith(i.op, a, b));
        break;
      }
      case opcode::compare_eq: {
        ref b = pop();
        ref a = pop();
        stack.push_back(make_bool(equal(a, b)));
        break;
      }
      case opcode::compare_lt: {
        ref b = pop();
        ref a = pop();
        stack.push_back(make_bool(less(a, b)));
        break;
      }
      case opcode::build_tuple:stack.push_back(make_tuple(pop_n(i.arg)));
        break;
      case opcode::build_list:stack.push_back(std::make_shared<list>(pop_n(i.arg)));
        break;
      case opcode::build_map: {
        auto kv = pop_n(size_t(i.arg) * 2);
        auto d = std::make_shared<dict>();
        for (size_t k = 0; k < kv.size(); k += 2)d->set(kv[k], kv[k + 1]);
        stack.push_back(d);
        break;
      }
      case opcode::call: {
        auto call_args = pop_n(i.arg);
        ref callee = pop();
        stack.push_back(call(callee, std::move(call_args)));
        break;
      }
      case opcode::make_function: {
        auto qualname = expect<string>(pop(), "make_function qualname");
        auto fco = expect<code>(pop(), "make_function code");
        std::vector<std::shared_ptr<cell>> closure;
        std::vector<ref> defaults;
        if (i.arg & MAKE_FUNCTION_CLOSURE) {
          auto cells_tuple = expect<tuple>(pop(), "make_function closure");
          for (const ref &c : cells_tuple->items)closure.push_back(expect<cell>(c, "make_function closure"));
        }
        if (i.arg & MAKE_FUNCTION_DEFAULTS)defaults = expect<tuple>(pop(), "make_function defaults")->items;
        stack.push_back(make_function(fco, f.globals, qualname->v, std::move(closure), std::move(defaults)));
        break;
      }
      case opcode::build_class: {
        auto qualname = expect<string>(pop(), "build_class qualname");
        auto name = expect<string>(pop(), "build_class name");
        auto ns = expect<dict>(pop(), "build_class namespace");
        auto bases_tuple = expect<tuple>(pop(), "build_class bases");
        std::vector<std::shared_ptr<type>> bases;
        for (const ref &b : bases_tuple->items)bases.push_back(expect<type>(b, "build_class base"));
        attr_map attrs;
        for (const auto&[k, v] : ns->entries)attrs[expect<string>(k, "class attribute name")->v] = v;
        stack.push_back(make_class(name->v, qualname->v, module_name(), std::move(bases), std::move(attrs)));
        break;
      }
      case opcode::build_enum: {
        auto qualname = expect<string>(pop(), "build_enum qualname");
        auto name = expect<string>(pop(), "build_enum name");
        auto members = expect<dict>(pop(), "build_enum members");
        std::vector<std::pair<std::string, ref>> m;
        for (const auto&[k, v] : members->entries)m.emplace_back(expect<string>(k, "enum member name")->v, v);
        stack.push_back(make_enum(name->v, qualname->v, module_name(), m));
        break;
      }
      case opcode::return_value:return pop();
      case opcode::pop_top:pop();
        break;
      case opcode::dup_top: {
        if (stack.empty())throw error::value_error(co.qualname + ": stack underflow");
        stack.push_back(stack.back());
        break;
      }
      case opcode::jump:pc = i.arg;
        break;
      case opcode::pop_jump_if_false:
        if (!truthy(pop()))pc = i.arg;
        break;
    }
  }
  return none();
}

}
