#ifndef BPICKLE_LIB_CLOUD_GLOBALS_H_
#define BPICKLE_LIB_CLOUD_GLOBALS_H_

#include <rt/runtime.h>
#include <set>

namespace bpickle::cloud {

typedef std::set<std::string, std::less<>> name_set;

/**
 * Names a code unit reads, writes or deletes as globals, nested code included.
 * Results are cached per unit; the cache does not keep units alive.
 * */
class global_extractor {
 public:
  global_extractor() = default;
  global_extractor(const global_extractor &) = delete;
  global_extractor &operator=(const global_extractor &) = delete;

  std::shared_ptr<const name_set> extract(const std::shared_ptr<rt::code> &co);
  // entries whose unit is still alive
  [[nodiscard]] size_t cache_size() const;

 private:
  mutable std::mutex mu;
  std::map<std::weak_ptr<rt::code>, std::shared_ptr<const name_set>, std::owner_less<>> cache;
};

// every name in the name tables of co and of the code nested in it
name_set all_names(const rt::code &co);

// loaded submodules of the module dependencies that co reaches through attribute access only
std::vector<std::shared_ptr<rt::module>> find_imported_submodules(const rt::runtime &rt, const rt::code &co,
                                                                  const std::vector<rt::ref> &top_level_dependencies);

}

#endif //BPICKLE_LIB_CLOUD_GLOBALS_H_
