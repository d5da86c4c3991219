#ifndef BPICKLE_LIB_CLOUD_SKELETON_H_
#define BPICKLE_LIB_CLOUD_SKELETON_H_

#include <cloud/tracker.h>
#include <set>

namespace bpickle::cloud {

struct class_shape {
  std::string name, qualname, module;
  std::vector<std::shared_ptr<rt::type>> bases;
  std::string tracking_id; // empty: never deduplicated
};

struct enum_shape {
  std::string name, qualname, module;
  std::vector<std::pair<std::string, rt::ref>> members;
  std::string tracking_id;
};

/**
 * Rebuilds dynamic classes in two steps: begin() creates an empty shell, or returns the class already
 * known under the tracking id; commit() fills a shell created by this builder with the class body.
 * A class returned by dedup is never filled again.
 * */
class skeleton_builder {
 public:
  struct handle {
    std::shared_ptr<rt::type> type;
    bool fresh; // false when deduplicated
  };

  skeleton_builder(rt::runtime &rt, class_tracker &tracker);
  skeleton_builder(const skeleton_builder &) = delete;
  skeleton_builder &operator=(const skeleton_builder &) = delete;

  handle begin(const class_shape &shape);
  handle begin(const enum_shape &shape);
  // returns false, and leaves the class untouched, unless t is a shell still waiting for its body
  bool commit(const std::shared_ptr<rt::type> &t, const rt::attr_map &body);

 private:
  handle track(const std::string &id, const std::shared_ptr<rt::type> &t);
  static void check_same_shape(const rt::type &existing, rt::type::meta_t meta, std::string_view name);

  rt::runtime &rt;
  class_tracker &tracker;
  std::mutex mu;
  std::set<std::weak_ptr<rt::type>, std::owner_less<>> pending;
};

}

#endif //BPICKLE_LIB_CLOUD_SKELETON_H_
