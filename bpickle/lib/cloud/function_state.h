#ifndef BPICKLE_LIB_CLOUD_FUNCTION_STATE_H_
#define BPICKLE_LIB_CLOUD_FUNCTION_STATE_H_

#include <cloud/globals.h>

namespace bpickle::cloud {

/**
 * Splits a dynamic function into a shell, rebuilt from (code, base globals, cell count),
 * and a state tuple (attributes, globals subset, closure cells, implicit submodules) applied once the shell
 * is memoized, so that the state may refer back to the function itself.
 * */
class function_capsule {
 public:
  function_capsule(rt::runtime &rt, global_extractor &extractor);

  rt::ref capture(const std::shared_ptr<rt::function> &f) const;
  std::shared_ptr<rt::function> make_shell(const std::shared_ptr<rt::code> &co,
                                           const std::shared_ptr<rt::dict> &base_globals,
                                           int64_t n_cells) const;
  void restore(const std::shared_ptr<rt::function> &f, const rt::ref &state) const;

  // the subset of f's globals its code refers to
  std::shared_ptr<rt::dict> referenced_globals(const rt::function &f) const;

 private:
  rt::runtime &rt;
  global_extractor &extractor;
};

}

#endif //BPICKLE_LIB_CLOUD_FUNCTION_STATE_H_
