#ifndef BPICKLE_LIB_RT_CODE_H_
#define BPICKLE_LIB_RT_CODE_H_

#include <rt/object.h>

namespace bpickle::rt {

enum class opcode : uint8_t {
  nop = 0,
  load_const, load_fast, store_fast,
  load_global, store_global, delete_global,
  load_deref, store_deref, load_closure,
  load_attr, store_attr, import_name,
  binary_add, binary_sub, binary_mul, compare_eq, compare_lt,
  build_tuple, build_list, build_map,
  call, make_function, build_class, build_enum,
  return_value, pop_top, dup_top,
  jump, pop_jump_if_false,
  last_ = pop_jump_if_false
};
std::string_view opcode_to_string(opcode op);
std::optional<opcode> opcode_of_string(std::string_view s);
bool opcode_has_arg(opcode op);

struct instruction {
  opcode op;
  uint32_t arg = 0;
  bool operator==(const instruction &o) const { return op == o.op && arg == o.arg; }
};

// make_function argument flags
static constexpr uint32_t MAKE_FUNCTION_DEFAULTS = 0x01;
static constexpr uint32_t MAKE_FUNCTION_CLOSURE = 0x08;

struct code : public object {
  BPICKLE_RT_KIND(code)
  // code flags
  static constexpr uint32_t FLAG_COROUTINE = 0x80;

  std::string name, qualname, filename;
  uint32_t first_line = 0;
  uint32_t argcount = 0;
  uint32_t flags = 0;
  std::vector<instruction> instructions;
  std::vector<ref> consts;
  std::vector<std::string> names;    // globals, attributes and imports
  std::vector<std::string> varnames; // arguments first, then locals
  std::vector<std::string> cellvars; // locals captured by nested functions
  std::vector<std::string> freevars; // captured from the enclosing scope

  [[nodiscard]] size_t n_cells() const { return cellvars.size() + freevars.size(); }
  [[nodiscard]] std::vector<std::shared_ptr<code>> nested() const;
  // throws error::value_error describing the first out-of-range operand
  void validate() const;
};

}

#endif //BPICKLE_LIB_RT_CODE_H_
