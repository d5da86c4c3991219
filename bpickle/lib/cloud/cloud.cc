#include <cloud/cloud.h>
#include <cloud/dispatch.h>
#include <cloud/reconstructors.h>
#include <util/message.h>

namespace bpickle::cloud {

std::string_view strategy_to_string(strategy s) {
  switch (s) {
    case strategy::pickle:return "pickle";
    case strategy::cloud:return "cloud";
  }
  BPICKLE_THROW_INTERNAL_ERROR
}

std::optional<strategy> strategy_of_string(std::string_view s) {
  if (s == "pickle")return strategy::pickle;
  if (s == "cloud")return strategy::cloud;
  return {};
}

engine::engine(rt::runtime &rt)
    : rt(rt), resolver_(rt), builder_(rt, tracker_), capsule_(rt, extractor_) {
  debug_ = util::get_env(DEBUG_ENV).has_value();
  set_pickler();
  reconstructors_ = install_reconstructors(*this);
}

engine::~engine() {
  if (rt.find_module(RECONSTRUCTORS_MODULE) == reconstructors_)rt.remove_module(RECONSTRUCTORS_MODULE);
}

void engine::set_pickler(std::optional<std::string_view> name) {
  std::optional<std::string> from_env;
  if (!name) {
    from_env = util::get_env(PICKLER_ENV);
    if (!from_env || from_env->empty()) {
      strategy_ = strategy::cloud;
      return;
    }
    name = *from_env;
  }
  auto s = strategy_of_string(*name);
  if (!s)
    throw rt::error::value_error(std::string("unknown pickler '").append(*name)
                                     .append("', expected one of: pickle, cloud"));
  strategy_ = *s;
  note(std::string("using the ").append(strategy_to_string(strategy_)).append(" pickler"));
}

void engine::note(std::string_view what) const {
  if (debug_)util::message::note_string(what).print(std::cerr);
}

std::unique_ptr<pickle::pickler> engine::make_pickler(std::optional<strategy> s) {
  switch (s.value_or(strategy_)) {
    case strategy::pickle:return std::make_unique<pickle::pickler>(rt);
    case strategy::cloud:return std::make_unique<cloud_pickler>(*this);
  }
  BPICKLE_THROW_INTERNAL_ERROR
}

std::string engine::dumps(const rt::ref &obj) {
  return make_pickler()->dumps(obj);
}

rt::ref engine::loads(std::string_view data) {
  pickle::unpickler u(rt);
  return u.loads(data);
}

}
