#include <cloud/tracker.h>

namespace bpickle::cloud {

std::string new_tracking_id(std::mt19937_64 &rng) {
  static constexpr std::string_view digits = "0123456789abcdef";
  std::string id;
  for (int half = 0; half < 2; ++half) {
    uint64_t bits = rng();
    for (int i = 0; i < 16; ++i, bits >>= 4)id.push_back(digits[bits & 0xf]);
  }
  return id;
}

class_tracker::class_tracker() : rng(std::random_device{}()) {}

void class_tracker::purge() {
  std::erase_if(by_id, [](const auto &e) { return e.second.expired(); });
  std::erase_if(by_type, [](const auto &e) { return e.first.expired(); });
}

std::string class_tracker::get_or_create_id(const std::shared_ptr<rt::type> &t) {
  std::lock_guard<std::mutex> lk(mu);
  if (auto it = by_type.find(t); it != by_type.end())return it->second;
  purge();
  std::string id = new_tracking_id(rng);
  while (by_id.contains(id))id = new_tracking_id(rng);
  by_id.emplace(id, t);
  by_type.emplace(t, id);
  return id;
}

std::shared_ptr<rt::type> class_tracker::lookup(std::string_view id) const {
  std::lock_guard<std::mutex> lk(mu);
  auto it = by_id.find(id);
  if (it == by_id.end())return nullptr;
  return it->second.lock();
}

std::shared_ptr<rt::type> class_tracker::register_if_absent(std::string_view id, const std::shared_ptr<rt::type> &t) {
  std::lock_guard<std::mutex> lk(mu);
  if (auto it = by_id.find(id); it != by_id.end()) {
    if (auto existing = it->second.lock())return existing;
  }
  purge();
  by_id.insert_or_assign(std::string(id), t);
  by_type.insert_or_assign(t, std::string(id));
  return t;
}

size_t class_tracker::size() const {
  std::lock_guard<std::mutex> lk(mu);
  return std::count_if(by_id.begin(), by_id.end(), [](const auto &e) { return !e.second.expired(); });
}

}
