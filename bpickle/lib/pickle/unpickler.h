#ifndef BPICKLE_LIB_PICKLE_UNPICKLER_H_
#define BPICKLE_LIB_PICKLE_UNPICKLER_H_

#include <rt/runtime.h>
#include <pickle/error.h>
#include <pickle/wire.h>

namespace bpickle::pickle {

class unpickler {
 public:
  explicit unpickler(rt::runtime &rt);
  unpickler(const unpickler &) = delete;
  unpickler &operator=(const unpickler &) = delete;
  virtual ~unpickler() = default;

  // decodes one object graph; throws error::corruption on malformed input
  rt::ref loads(std::string_view data);

 protected:
  // resolves a GLOBAL record by importing the module
  virtual rt::ref find_class(std::string_view module, std::string_view qualname);

  rt::runtime &rt;

 private:
  rt::ref load(wire::reader &in);
  rt::ref load_reduce(wire::reader &in);
  void apply_state(const rt::ref &obj, const rt::ref &state, const rt::ref &restore);
  uint64_t read_count(wire::reader &in);

  std::vector<rt::ref> memo;
};

}

#endif //BPICKLE_LIB_PICKLE_UNPICKLER_H_
