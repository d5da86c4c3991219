#ifndef BPICKLE_LIB_RT_PARSE_ASM_H_
#define BPICKLE_LIB_RT_PARSE_ASM_H_

#include <rt/code.h>
#include <util/message.h>

namespace bpickle::rt::parse_asm {

namespace error {
class t : public rt::error::t {
 public:
  t() : rt::error::t("rt::parse_asm::error") {}
};

struct report_token : public t, public util::message::error_report_token_front_back {
  report_token(std::string_view front, std::string_view token, std::string_view back)
      : util::message::error_report_token_front_back(front, token, back) {}
};

struct unknown_opcode : public t, public util::message::error_token {
  explicit unknown_opcode(std::string_view found) : util::message::error_token(found) {}
  void describe(std::ostream &os) const final {
    os << "unknown opcode " << util::message::style::bold << token << util::message::style::clear;
  }
};

struct undefined_name : public t, public util::message::error_token {
  std::string_view what;
  undefined_name(std::string_view what, std::string_view found) : util::message::error_token(found), what(what) {}
  void describe(std::ostream &os) const final {
    os << what << " " << util::message::style::bold << token << util::message::style::clear << " was never defined";
  }
};
}

typedef std::map<std::string, std::shared_ptr<code>, std::less<>> program;

// Parses every .code block of a source file. Tokens in thrown errors point into `source`.
program parse_file(std::string_view source, std::string_view filename = "source.basm");

// The "<module>" block of a source file, with its nested code resolved.
std::shared_ptr<code> parse_module(std::string_view source, std::string_view filename = "source.basm");

}

#endif //BPICKLE_LIB_RT_PARSE_ASM_H_
