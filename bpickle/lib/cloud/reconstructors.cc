#include <cloud/reconstructors.h>
#include <cloud/cloud.h>

namespace bpickle::cloud {

namespace {

void expect_args(const rt::args_t &args, size_t n, std::string_view name) {
  if (args.size() != n)
    throw rt::error::type_error(std::string(name).append("() takes ").append(std::to_string(n))
                                    .append(" arguments (").append(std::to_string(args.size())).append(" given)"));
}

std::string str_of(const rt::ref &o, std::string_view what) {
  return rt::expect<rt::string>(o, what)->v;
}

std::vector<std::string> strings_of(const rt::ref &o, std::string_view what) {
  std::vector<std::string> v;
  for (const rt::ref &s : rt::expect<rt::tuple>(o, what)->items)v.push_back(str_of(s, what));
  return v;
}

uint32_t u32_of(const rt::ref &o, std::string_view what) {
  const int64_t v = rt::expect<rt::integer>(o, what)->v;
  if (v < 0 || v > int64_t(UINT32_MAX))throw pickle::error::corruption(std::string(what) + " out of range");
  return uint32_t(v);
}

rt::ref make_code(rt::args_t &args) {
  expect_args(args, 12, "make_code");
  auto co = std::make_shared<rt::code>();
  co->name = str_of(args[0], "co_name");
  co->qualname = str_of(args[1], "co_qualname");
  co->filename = str_of(args[2], "co_filename");
  co->first_line = u32_of(args[3], "co_firstlineno");
  co->argcount = u32_of(args[4], "co_argcount");
  co->flags = u32_of(args[5], "co_flags");
  co->instructions = unpack_instructions(str_of(args[6], "co_code"));
  co->consts = rt::expect<rt::tuple>(args[7], "co_consts")->items;
  co->names = strings_of(args[8], "co_names");
  co->varnames = strings_of(args[9], "co_varnames");
  co->cellvars = strings_of(args[10], "co_cellvars");
  co->freevars = strings_of(args[11], "co_freevars");
  try {
    co->validate();
  } catch (const rt::error::value_error &e) {
    throw pickle::error::corruption(e.what());
  }
  return co;
}

rt::ref make_dict_view(rt::args_t &args) {
  expect_args(args, 2, "make_dict_view");
  const std::string view = str_of(args[0], "view");
  auto d = rt::expect<rt::dict>(args[1], "mapping");
  if (view == "keys")return std::make_shared<rt::dict_view>(rt::kind_t::dict_keys, d);
  if (view == "values")return std::make_shared<rt::dict_view>(rt::kind_t::dict_values, d);
  if (view == "items")return std::make_shared<rt::dict_view>(rt::kind_t::dict_items, d);
  throw pickle::error::corruption("unknown dict view " + view);
}

}

std::string pack_instructions(const std::vector<rt::instruction> &instructions) {
  std::string packed;
  packed.reserve(instructions.size() * 5);
  for (const rt::instruction &i : instructions) {
    packed.push_back(char(i.op));
    for (int b = 0; b < 4; ++b)packed.push_back(char((i.arg >> (8 * b)) & 0xff));
  }
  return packed;
}

std::vector<rt::instruction> unpack_instructions(std::string_view packed) {
  if (packed.size() % 5 != 0)throw pickle::error::corruption("truncated instruction stream");
  std::vector<rt::instruction> v;
  for (size_t at = 0; at < packed.size(); at += 5) {
    const auto op = uint8_t(packed[at]);
    if (op > uint8_t(rt::opcode::last_))throw pickle::error::corruption("unknown opcode " + std::to_string(op));
    uint32_t arg = 0;
    for (int b = 0; b < 4; ++b)arg |= uint32_t(uint8_t(packed[at + 1 + b])) << (8 * b);
    v.push_back({rt::opcode(op), arg});
  }
  return v;
}

std::shared_ptr<rt::module> install_reconstructors(engine &e) {
  rt::runtime &rt = e.runtime();
  auto m = rt.add_module(RECONSTRUCTORS_MODULE, rt::module::builtin);
  auto empty_cell_value = rt.make_class(EMPTY_CELL_VALUE, EMPTY_CELL_VALUE, m->name);
  m->ns->set(EMPTY_CELL_VALUE, empty_cell_value);

  rt.make_native("make_skeleton_class", [&e](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 5, "make_skeleton_class");
    class_shape shape{str_of(args[0], "name"), str_of(args[1], "qualname"), str_of(args[2], "module"), {},
                      str_of(args[4], "tracking id")};
    for (const rt::ref &b : rt::expect<rt::tuple>(args[3], "bases")->items)
      shape.bases.push_back(rt::expect<rt::type>(b, "base"));
    auto h = e.builder().begin(shape);
    e.note((h.fresh ? "built skeleton of class " : "reusing class ") + shape.qualname + " (" + shape.tracking_id + ")");
    return h.type;
  }, m);

  rt.make_native("make_skeleton_enum", [&e](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 5, "make_skeleton_enum");
    enum_shape shape{str_of(args[0], "name"), str_of(args[1], "qualname"), str_of(args[2], "module"), {},
                     str_of(args[4], "tracking id")};
    for (const rt::ref &p : rt::expect<rt::tuple>(args[3], "members")->items) {
      auto pair = rt::expect<rt::tuple>(p, "member");
      if (pair->items.size() != 2)throw pickle::error::corruption("malformed member of " + shape.qualname);
      shape.members.emplace_back(str_of(pair->items[0], "member name"), pair->items[1]);
    }
    auto h = e.builder().begin(shape);
    e.note((h.fresh ? "built skeleton of enum " : "reusing enum ") + shape.qualname + " (" + shape.tracking_id + ")");
    return h.type;
  }, m);

  rt.make_native("class_setstate", [&e](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 2, "class_setstate");
    auto t = rt::expect<rt::type>(args[0], "class");
    rt::attr_map body;
    for (const auto&[k, v] : rt::expect<rt::dict>(args[1], "class dict")->entries)
      body.emplace(str_of(k, "attribute name"), v);
    e.builder().commit(t, body);
    return rt::none();
  }, m);

  rt.make_native("make_function", [&e](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 3, "make_function");
    return e.capsule().make_shell(rt::expect<rt::code>(args[0], "code"), rt::expect<rt::dict>(args[1], "globals"),
                                  rt::expect<rt::integer>(args[2], "cell count")->v);
  }, m);

  rt.make_native("function_setstate", [&e](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 2, "function_setstate");
    e.capsule().restore(rt::expect<rt::function>(args[0], "function"), args[1]);
    return rt::none();
  }, m);

  rt.make_native("make_code", [](rt::runtime &, rt::args_t &args) -> rt::ref {
    return make_code(args);
  }, m);

  rt.make_native("make_empty_cell", [](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 0, "make_empty_cell");
    return std::make_shared<rt::cell>();
  }, m);

  rt.make_native("cell_set", [empty_cell_value](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 2, "cell_set");
    auto c = rt::expect<rt::cell>(args[0], "cell");
    if (args[1] != empty_cell_value)c->contents = args[1];
    return rt::none();
  }, m);

  rt.make_native("allocate_lock", [](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 1, "allocate_lock");
    auto l = std::make_shared<rt::lock>();
    if (rt::truthy(args[0]))l->acquire();
    return l;
  }, m);

  rt.make_native("make_dict_view", [](rt::runtime &, rt::args_t &args) -> rt::ref {
    return make_dict_view(args);
  }, m);

  rt.make_native("subimport", [](rt::runtime &rt, rt::args_t &args) -> rt::ref {
    expect_args(args, 1, "subimport");
    const std::string name = str_of(args[0], "module name");
    try {
      return rt.import_module(name);
    } catch (const rt::error::import_error &err) {
      throw pickle::error::corruption(err.what());
    }
  }, m);

  // by-value modules are not published in the module table of the loading runtime
  rt.make_native("dynamic_subimport", [](rt::runtime &, rt::args_t &args) -> rt::ref {
    expect_args(args, 1, "dynamic_subimport");
    return std::make_shared<rt::module>(str_of(args[0], "module name"), rt::module::ad_hoc);
  }, m);

  return m;
}

}
