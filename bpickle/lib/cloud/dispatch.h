#ifndef BPICKLE_LIB_CLOUD_DISPATCH_H_
#define BPICKLE_LIB_CLOUD_DISPATCH_H_

#include <pickle/pickler.h>

namespace bpickle::cloud {

class engine;

/**
 * A pickler that also encodes what only exists in the current process: classes and functions defined
 * in __main__ or in a function body, their closures, and a catalog of runtime objects the plain
 * pickler rejects.
 * Types, functions and native functions go through reducer_override; the catalog sits in the
 * dispatch table and is only consulted when the override declines.
 * */
class cloud_pickler : public pickle::pickler {
 public:
  explicit cloud_pickler(engine &e);

 protected:
  std::optional<pickle::reduce_value> reducer_override(const rt::ref &obj) override;

 private:
  std::optional<pickle::reduce_value> class_reduce(const std::shared_ptr<rt::type> &t);
  pickle::reduce_value dynamic_class_reduce(const std::shared_ptr<rt::type> &t);
  std::optional<pickle::reduce_value> function_reduce(const std::shared_ptr<rt::function> &f);
  pickle::reduce_value dynamic_function_reduce(const std::shared_ptr<rt::function> &f);
  std::optional<pickle::reduce_value> native_function_reduce(const std::shared_ptr<rt::native_function> &n);
  std::shared_ptr<rt::dict> base_globals_for(const std::shared_ptr<rt::dict> &globals);
  [[nodiscard]] rt::ref reconstructor(std::string_view name) const;
  void install_dispatch_table();

  engine &e;
  // functions sharing a globals dict share one rebuilt namespace
  std::map<std::shared_ptr<rt::dict>, std::shared_ptr<rt::dict>> base_globals;
};

// the class namespace without the entries it shares with its only base
rt::attr_map extract_class_dict(const rt::type &t);

}

#endif //BPICKLE_LIB_CLOUD_DISPATCH_H_
