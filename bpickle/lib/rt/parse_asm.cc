#include <rt/parse_asm.h>
#include <charconv>

namespace bpickle::rt::parse_asm {

namespace {

constexpr std::string_view module_block = "<module>";

bool is_space(char c) { return c <= 32; }

// first whitespace-delimited word of s
std::string_view first_word(std::string_view s) {
  return util::itr_sv(s.begin(), std::find_if(s.begin(), s.end(), is_space));
}

std::string_view strip_comment(std::string_view s) {
  bool in_string = false;
  for (auto it = s.begin(); it != s.end(); ++it) {
    if (in_string && *it == '\\') {
      if (it + 1 != s.end())++it;
      continue;
    }
    if (*it == '"')in_string = !in_string;
    if (!in_string && *it == '#')return util::itr_sv(s.begin(), it);
  }
  return s;
}

std::vector<std::string_view> split_words(std::string_view s) {
  std::vector<std::string_view> words;
  for (s = util::trim(s); !s.empty(); s = util::trim(s)) {
    std::string_view w = first_word(s);
    words.push_back(w);
    s.remove_prefix(w.size());
  }
  return words;
}

template<typename Int>
Int parse_int(std::string_view tk) {
  std::string_view s = tk;
  if (s.empty() || s.front() != '$')throw error::report_token("expected an integer immediate, found", tk, "");
  s.remove_prefix(1);
  bool negative = false;
  if (!s.empty() && s.front() == '-') {
    negative = true;
    s.remove_prefix(1);
  }
  int base = 10;
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
    base = 16;
    s.remove_prefix(2);
  }
  Int n = 0;
  auto[p, ec] = std::from_chars(s.data(), s.data() + s.size(), n, base);
  if (s.empty() || ec != std::errc() || p != s.data() + s.size())
    throw error::report_token("", tk, "is not a valid integer literal");
  return negative ? Int(-n) : n;
}

std::string parse_string(std::string_view tk) {
  if (tk.size() < 2 || tk.front() != '"' || tk.back() != '"')
    throw error::report_token("", tk, "is not a valid string literal");
  std::string s;
  for (auto it = tk.begin() + 1; it + 1 != tk.end(); ++it) {
    if (*it != '\\') {
      s.push_back(*it);
      continue;
    }
    ++it;
    if (it + 1 == tk.end() || !util::chars::is_valid_mnemonic(*it))
      throw error::report_token("invalid escape sequence in", tk, "");
    s.push_back(util::chars::parse_mnemonic(*it));
  }
  return s;
}

// string literals may contain spaces: operand is everything after the opcode
struct line {
  std::string_view op, operand;
};

struct pending_code_ref {
  std::shared_ptr<code> owner;
  size_t const_index;
  std::string_view token;
};

class block_parser {
 public:
  block_parser(std::shared_ptr<code> co, std::vector<pending_code_ref> &refs) : co(std::move(co)), refs(refs) {}

  void header(std::string_view directive, std::string_view rest) {
    auto words = split_words(rest);
    if (!co->instructions.empty() || !lines.empty())
      throw error::report_token("directive", directive, "must precede the instructions of a block");
    if (directive == ".args") {
      if (co->argcount != 0)throw error::report_token("repeated directive", directive, "");
      for (auto w : words)local_index(w);
      co->argcount = uint32_t(words.size());
      if (co->varnames.size() != words.size())throw error::report_token("repeated argument in", directive, "");
    } else if (directive == ".cellvars") {
      for (auto w : words)co->cellvars.emplace_back(w);
    } else if (directive == ".freevars") {
      for (auto w : words)co->freevars.emplace_back(w);
    } else if (directive == ".flags") {
      for (auto w : words) {
        if (w == "coroutine")co->flags |= code::FLAG_COROUTINE;
        else throw error::report_token("unknown flag", w, "");
      }
    } else {
      throw error::report_token("unknown directive", directive, "");
    }
  }

  void label(std::string_view name) {
    if (labels.find(name) != labels.end())throw error::report_token("label", name, "is defined twice");
    labels.emplace(std::string(name), uint32_t(lines.size()));
  }

  void instruction_line(std::string_view s) {
    std::string_view op = first_word(s);
    lines.push_back({op, util::trim(s.substr(op.size()))});
  }

  void finish() {
    co->instructions.reserve(lines.size());
    for (const line &l : lines)co->instructions.push_back(parse_instruction(l));
  }

 private:
  uint32_t local_index(std::string_view n) {
    auto it = std::find(co->varnames.begin(), co->varnames.end(), n);
    if (it != co->varnames.end())return uint32_t(std::distance(co->varnames.begin(), it));
    co->varnames.emplace_back(n);
    return uint32_t(co->varnames.size() - 1);
  }

  uint32_t name_index(std::string_view n) {
    auto it = std::find(co->names.begin(), co->names.end(), n);
    if (it != co->names.end())return uint32_t(std::distance(co->names.begin(), it));
    co->names.emplace_back(n);
    return uint32_t(co->names.size() - 1);
  }

  uint32_t cell_index(std::string_view n) {
    auto it = std::find(co->cellvars.begin(), co->cellvars.end(), n);
    if (it != co->cellvars.end())return uint32_t(std::distance(co->cellvars.begin(), it));
    it = std::find(co->freevars.begin(), co->freevars.end(), n);
    if (it != co->freevars.end())return uint32_t(co->cellvars.size() + std::distance(co->freevars.begin(), it));
    throw error::undefined_name("cell variable", n);
  }

  uint32_t const_index(std::string_view tk) {
    ref v;
    if (tk.front() == '"') {
      v = make_str(parse_string(tk));
    } else if (tk.front() == '$') {
      if (tk.find('.') != std::string_view::npos) {
        double d = 0;
        auto[p, ec] = std::from_chars(tk.data() + 1, tk.data() + tk.size(), d);
        if (ec != std::errc() || p != tk.data() + tk.size())
          throw error::report_token("", tk, "is not a valid float literal");
        v = std::make_shared<floating>(d);
      } else {
        v = make_int(parse_int<int64_t>(tk));
      }
    } else if (tk.front() == '@') {
      co->consts.push_back(nullptr);
      refs.push_back({co, co->consts.size() - 1, tk});
      return uint32_t(co->consts.size() - 1);
    } else if (tk == "none") {
      v = none();
    } else if (tk == "true") {
      v = make_bool(true);
    } else if (tk == "false") {
      v = make_bool(false);
    } else if (tk == "ellipsis") {
      v = ellipsis();
    } else {
      throw error::report_token("", tk, "is not a constant");
    }
    for (size_t i = 0; i < co->consts.size(); ++i)
      if (co->consts[i] && co->consts[i]->kind() == v->kind() && same_key(co->consts[i], v))return uint32_t(i);
    co->consts.push_back(std::move(v));
    return uint32_t(co->consts.size() - 1);
  }

  uint32_t jump_target(std::string_view tk) {
    if (tk.front() == '$')return parse_int<uint32_t>(tk);
    auto it = labels.find(tk);
    if (it == labels.end())throw error::undefined_name("label", tk);
    return it->second;
  }

  instruction parse_instruction(const line &l) {
    auto op = opcode_of_string(l.op);
    if (!op)throw error::unknown_opcode(l.op);
    instruction i{*op, 0};
    if (!opcode_has_arg(*op)) {
      if (!l.operand.empty())throw error::report_token("unexpected operand", l.operand, "");
      return i;
    }
    if (l.operand.empty())throw error::report_token("opcode", l.op, "requires an operand");
    const std::string_view tk = l.operand;
    auto single_word = [&]() {
      if (first_word(tk).size() != tk.size())throw error::report_token("expected a single operand, found", tk, "");
    };
    switch (*op) {
      case opcode::load_const:i.arg = const_index(tk);
        break;
      case opcode::load_fast:
      case opcode::store_fast:single_word();
        i.arg = tk.front() == '$' ? parse_int<uint32_t>(tk) : local_index(tk);
        break;
      case opcode::load_global:
      case opcode::store_global:
      case opcode::delete_global:
      case opcode::load_attr:
      case opcode::store_attr:
      case opcode::import_name:single_word();
        i.arg = name_index(tk);
        break;
      case opcode::load_deref:
      case opcode::store_deref:
      case opcode::load_closure:single_word();
        i.arg = tk.front() == '$' ? parse_int<uint32_t>(tk) : cell_index(tk);
        break;
      case opcode::jump:
      case opcode::pop_jump_if_false:single_word();
        i.arg = jump_target(tk);
        break;
      default:single_word();
        i.arg = parse_int<uint32_t>(tk);
        break;
    }
    return i;
  }

  std::shared_ptr<code> co;
  std::vector<pending_code_ref> &refs;
  std::vector<line> lines;
  std::map<std::string, uint32_t, std::less<>> labels;
};

}

program parse_file(std::string_view source, std::string_view filename) {
  program p;
  std::vector<pending_code_ref> refs;
  std::optional<block_parser> current;
  std::string_view current_directive;
  uint32_t line_no = 0;

  for (auto begin = source.begin(), end = std::find(begin, source.end(), 10); begin != source.end();
       begin = end + (end != source.end()), end = std::find(begin, source.end(), 10)) {
    ++line_no;
    std::string_view s = util::trim(strip_comment(util::itr_sv(begin, end)));
    if (s.empty())continue;
    if (s.front() == '.') {
      std::string_view directive = first_word(s);
      std::string_view rest = util::trim(s.substr(directive.size()));
      if (directive == ".code") {
        if (current)throw error::report_token("block", current_directive, "is missing its .end");
        if (rest.empty() || first_word(rest).size() != rest.size())
          throw error::report_token("directive", directive, "requires a single qualified name");
        if (p.find(rest) != p.end())throw error::report_token("code block", rest, "is defined twice");
        auto co = std::make_shared<code>();
        co->qualname = rest;
        co->name = rest == module_block ? std::string(rest) : std::string(util::split_dotted(rest).back());
        co->filename = filename;
        co->first_line = line_no;
        p.emplace(std::string(rest), co);
        current.emplace(co, refs);
        current_directive = rest;
        continue;
      }
      if (!current)throw error::report_token("directive", directive, "outside of a .code block");
      if (directive == ".end") {
        current->finish();
        current.reset();
        continue;
      }
      current->header(directive, rest);
      continue;
    }
    if (!current)throw error::report_token("instruction", first_word(s), "outside of a .code block");
    // labels
    for (auto it = std::find(s.begin(), s.end(), ':'); !s.empty() && s.front() != '"' && it != s.end()
        && std::find_if(s.begin(), it, is_space) == it; it = std::find(s.begin(), s.end(), ':')) {
      current->label(util::itr_sv(s.begin(), it));
      s = util::trim(s.substr(std::distance(s.begin(), it) + 1));
    }
    if (!s.empty())current->instruction_line(s);
  }
  if (current)throw error::report_token("block", current_directive, "is missing its .end");

  for (const pending_code_ref &r : refs) {
    auto it = p.find(r.token.substr(1));
    if (it == p.end())throw error::undefined_name("code block", r.token);
    r.owner->consts[r.const_index] = it->second;
  }
  for (const auto &kv : p)kv.second->validate();
  return p;
}

std::shared_ptr<code> parse_module(std::string_view source, std::string_view filename) {
  program p = parse_file(source, filename);
  auto it = p.find(module_block);
  if (it == p.end())throw error::report_token("missing block", module_block, "");
  return it->second;
}

}
