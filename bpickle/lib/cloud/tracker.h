#ifndef BPICKLE_LIB_CLOUD_TRACKER_H_
#define BPICKLE_LIB_CLOUD_TRACKER_H_

#include <rt/runtime.h>
#include <random>

namespace bpickle::cloud {

/**
 * Gives every dynamic class a random tracking id, so that two streams carrying the same class
 * rebuild it once per process. Both directions are weak: tracking never keeps a class alive.
 * */
class class_tracker {
 public:
  class_tracker();
  class_tracker(const class_tracker &) = delete;
  class_tracker &operator=(const class_tracker &) = delete;

  std::string get_or_create_id(const std::shared_ptr<rt::type> &t);
  // nullptr when the id is unknown or its class is gone
  [[nodiscard]] std::shared_ptr<rt::type> lookup(std::string_view id) const;
  // the class already tracked under id if there is one, otherwise t, now tracked under id
  std::shared_ptr<rt::type> register_if_absent(std::string_view id, const std::shared_ptr<rt::type> &t);
  [[nodiscard]] size_t size() const;

 private:
  void purge();

  mutable std::mutex mu;
  std::map<std::string, std::weak_ptr<rt::type>, std::less<>> by_id;
  std::map<std::weak_ptr<rt::type>, std::string, std::owner_less<>> by_type;
  std::mt19937_64 rng;
};

// 32 lowercase hex digits
std::string new_tracking_id(std::mt19937_64 &rng);

}

#endif //BPICKLE_LIB_CLOUD_TRACKER_H_
