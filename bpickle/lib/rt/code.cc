#include <rt/code.h>

namespace bpickle::rt {

namespace {
constexpr auto opcode_names = util::make_array(
    std::string_view("nop"),
    std::string_view("load_const"), std::string_view("load_fast"), std::string_view("store_fast"),
    std::string_view("load_global"), std::string_view("store_global"), std::string_view("delete_global"),
    std::string_view("load_deref"), std::string_view("store_deref"), std::string_view("load_closure"),
    std::string_view("load_attr"), std::string_view("store_attr"), std::string_view("import_name"),
    std::string_view("binary_add"), std::string_view("binary_sub"), std::string_view("binary_mul"),
    std::string_view("compare_eq"), std::string_view("compare_lt"),
    std::string_view("build_tuple"), std::string_view("build_list"), std::string_view("build_map"),
    std::string_view("call"), std::string_view("make_function"), std::string_view("build_class"),
    std::string_view("build_enum"),
    std::string_view("return_value"), std::string_view("pop_top"), std::string_view("dup_top"),
    std::string_view("jump"), std::string_view("pop_jump_if_false"));
static_assert(opcode_names.size() == size_t(opcode::last_) + 1);
}

std::string_view opcode_to_string(opcode op) {
  if (size_t(op) >= opcode_names.size())BPICKLE_THROW_INTERNAL_ERROR
  return opcode_names[size_t(op)];
}

std::optional<opcode> opcode_of_string(std::string_view s) {
  auto it = std::find(opcode_names.begin(), opcode_names.end(), s);
  if (it == opcode_names.end())return {};
  return opcode(std::distance(opcode_names.begin(), it));
}

bool opcode_has_arg(opcode op) {
  switch (op) {
    case opcode::nop:
    case opcode::binary_add:
    case opcode::binary_sub:
    case opcode::binary_mul:
    case opcode::compare_eq:
    case opcode::compare_lt:
    case opcode::build_class:
    case opcode::build_enum:
    case opcode::return_value:
    case opcode::pop_top:
    case opcode::dup_top:return false;
    default:return true;
  }
}

std::vector<std::shared_ptr<code>> code::nested() const {
  std::vector<std::shared_ptr<code>> v;
  for (const ref &c : consts)
    if (auto co = as<code>(c))v.push_back(co);
  return v;
}

void code::validate() const {
  auto fail = [&](size_t pc, std::string_view why) {
    throw error::value_error(std::string("invalid code ").append(qualname).append(" at ").append(std::to_string(pc))
                                 .append(": ").append(why));
  };
  if (varnames.size() < argcount)fail(0, "fewer varnames than arguments");
  for (size_t pc = 0; pc < instructions.size(); ++pc) {
    const instruction &i = instructions[pc];
    if (size_t(i.op) > size_t(opcode::last_))fail(pc, "unknown opcode");
    switch (i.op) {
      case opcode::load_const:
        if (i.arg >= consts.size())fail(pc, "constant out of range");
        break;
      case opcode::load_fast:
      case opcode::store_fast:
        if (i.arg >= varnames.size())fail(pc, "local out of range");
        break;
      case opcode::load_global:
      case opcode::store_global:
      case opcode::delete_global:
      case opcode::load_attr:
      case opcode::store_attr:
      case opcode::import_name:
        if (i.arg >= names.size())fail(pc, "name out of range");
        break;
      case opcode::load_deref:
      case opcode::store_deref:
      case opcode::load_closure:
        if (i.arg >= n_cells())fail(pc, "cell out of range");
        break;
      case opcode::jump:
      case opcode::pop_jump_if_false:
        if (i.arg > instructions.size())fail(pc, "jump target out of range");
        break;
      default:break;
    }
  }
}

}
