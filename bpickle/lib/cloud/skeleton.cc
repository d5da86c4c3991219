#include <cloud/skeleton.h>
#include <pickle/error.h>

namespace bpickle::cloud {

skeleton_builder::skeleton_builder(rt::runtime &rt, class_tracker &tracker) : rt(rt), tracker(tracker) {}

void skeleton_builder::check_same_shape(const rt::type &existing, rt::type::meta_t meta, std::string_view name) {
  if (existing.meta != meta || existing.name != name)
    throw pickle::error::corruption(std::string("tracking id of ").append(name).append(" is already used by ")
                                        .append(existing.qualname));
}

skeleton_builder::handle skeleton_builder::track(const std::string &id, const std::shared_ptr<rt::type> &t) {
  if (!id.empty()) {
    auto tracked = tracker.register_if_absent(id, t);
    if (tracked != t) {
      check_same_shape(*tracked, t->meta, t->name);
      return {tracked, false};
    }
  }
  std::lock_guard<std::mutex> lk(mu);
  std::erase_if(pending, [](const auto &w) { return w.expired(); });
  pending.insert(t);
  return {t, true};
}

skeleton_builder::handle skeleton_builder::begin(const class_shape &shape) {
  if (!shape.tracking_id.empty()) {
    if (auto existing = tracker.lookup(shape.tracking_id)) {
      check_same_shape(*existing, rt::type::plain_class, shape.name);
      return {existing, false};
    }
  }
  for (const auto &b : shape.bases)
    if (b->meta != rt::type::plain_class)
      throw pickle::error::corruption(shape.qualname + " cannot derive from " + b->qualname);
  return track(shape.tracking_id, rt.make_class(shape.name, shape.qualname, shape.module, shape.bases));
}

skeleton_builder::handle skeleton_builder::begin(const enum_shape &shape) {
  if (!shape.tracking_id.empty()) {
    if (auto existing = tracker.lookup(shape.tracking_id)) {
      check_same_shape(*existing, rt::type::enumeration, shape.name);
      return {existing, false};
    }
  }
  std::shared_ptr<rt::type> t;
  try {
    t = rt.make_enum(shape.name, shape.qualname, shape.module, shape.members);
  } catch (const rt::error::value_error &e) {
    throw pickle::error::corruption(e.what());
  }
  return track(shape.tracking_id, t);
}

bool skeleton_builder::commit(const std::shared_ptr<rt::type> &t, const rt::attr_map &body) {
  {
    std::lock_guard<std::mutex> lk(mu);
    if (pending.erase(t) == 0)return false;
  }
  for (const auto&[name, value] : body) {
    if (t->meta == rt::type::enumeration && t->member(name))continue;
    t->attrs.insert_or_assign(name, value);
  }
  return true;
}

}
