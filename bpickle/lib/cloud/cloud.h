#ifndef BPICKLE_LIB_CLOUD_CLOUD_H_
#define BPICKLE_LIB_CLOUD_CLOUD_H_

#include <cloud/resolver.h>
#include <cloud/globals.h>
#include <cloud/tracker.h>
#include <cloud/skeleton.h>
#include <cloud/function_state.h>
#include <pickle/pickler.h>
#include <pickle/unpickler.h>

namespace bpickle::cloud {

enum class strategy { pickle, cloud };
std::string_view strategy_to_string(strategy s);
std::optional<strategy> strategy_of_string(std::string_view s);

static constexpr const char *PICKLER_ENV = "BPICKLE_PICKLER";
static constexpr const char *DEBUG_ENV = "BPICKLE_DEBUG";
static constexpr std::string_view RECONSTRUCTORS_MODULE = "_bpickle";

/**
 * Serialization for one runtime: installs the _bpickle reconstructor module into it and owns
 * the by-value policy, the global-name cache and the class tracker shared by every dump and load.
 * One engine per runtime.
 * */
class engine {
 public:
  explicit engine(rt::runtime &rt);
  engine(const engine &) = delete;
  engine &operator=(const engine &) = delete;
  ~engine();

  std::string dumps(const rt::ref &obj);
  rt::ref loads(std::string_view data);
  std::unique_ptr<pickle::pickler> make_pickler(std::optional<strategy> s = {});

  // nullopt rereads BPICKLE_PICKLER; unknown names throw rt::error::value_error
  void set_pickler(std::optional<std::string_view> name = {});
  [[nodiscard]] strategy current_strategy() const { return strategy_; }

  void register_by_value(const rt::ref &module) { resolver_.register_by_value(module); }
  void unregister_by_value(const rt::ref &module) { resolver_.unregister_by_value(module); }

  // prints a note to stderr when BPICKLE_DEBUG is set
  void note(std::string_view what) const;
  void set_debug(bool on) { debug_ = on; }

  [[nodiscard]] rt::runtime &runtime() { return rt; }
  [[nodiscard]] resolver &references() { return resolver_; }
  [[nodiscard]] global_extractor &extractor() { return extractor_; }
  [[nodiscard]] class_tracker &tracker() { return tracker_; }
  [[nodiscard]] skeleton_builder &builder() { return builder_; }
  [[nodiscard]] const function_capsule &capsule() const { return capsule_; }
  [[nodiscard]] std::shared_ptr<rt::module> reconstructors() const { return reconstructors_; }

 private:
  rt::runtime &rt;
  resolver resolver_;
  global_extractor extractor_;
  class_tracker tracker_;
  skeleton_builder builder_;
  function_capsule capsule_;
  std::shared_ptr<rt::module> reconstructors_;
  strategy strategy_ = strategy::cloud;
  bool debug_ = false;
};

}

#endif //BPICKLE_LIB_CLOUD_CLOUD_H_
