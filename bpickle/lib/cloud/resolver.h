#ifndef BPICKLE_LIB_CLOUD_RESOLVER_H_
#define BPICKLE_LIB_CLOUD_RESOLVER_H_

#include <rt/runtime.h>
#include <set>

namespace bpickle::cloud {

enum class decision { reference, value };
std::string_view decision_to_string(decision d);

/**
 * Decides whether a named object can travel as a (module, qualname) reference,
 * or has to be rebuilt from its contents on the other side.
 * Owns the set of modules whose members are always pickled by value.
 * */
class resolver {
 public:
  explicit resolver(rt::runtime &rt);
  resolver(const resolver &) = delete;
  resolver &operator=(const resolver &) = delete;

  // name defaults to the object's own qualname
  decision decide(const rt::ref &obj, std::optional<std::string> name = {}) const;
  decision decide_module(const std::shared_ptr<rt::module> &m) const;

  // the module an object is published in, as far as the runtime can tell
  std::optional<std::string> owning_module(const rt::ref &obj, std::string_view name) const;

  void register_by_value(const rt::ref &module);
  void unregister_by_value(const rt::ref &module);
  // true when the module, or a package containing it, is registered
  [[nodiscard]] bool is_registered_by_value(std::string_view module_name) const;
  [[nodiscard]] std::vector<std::string> registered() const;

 private:
  rt::runtime &rt;
  mutable std::mutex mu;
  std::set<std::string, std::less<>> by_value;
};

}

#endif //BPICKLE_LIB_CLOUD_RESOLVER_H_
