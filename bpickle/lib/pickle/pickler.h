#ifndef BPICKLE_LIB_PICKLE_PICKLER_H_
#define BPICKLE_LIB_PICKLE_PICKLER_H_

#include <rt/runtime.h>
#include <pickle/error.h>
#include <pickle/wire.h>
#include <set>
#include <unordered_map>

namespace bpickle::pickle {

/**
 * How to rebuild an object: call constructor(*args), then, if present, apply state with restore(obj, state).
 * Without restore a dict state is applied one attribute at a time.
 * */
struct reduce_value {
  rt::ref constructor;
  std::vector<rt::ref> args;
  std::optional<rt::ref> state;
  rt::ref restore;
};

// The loaded module (other than __main__) under which `qualname` resolves to `obj` itself, if any.
// Modules whose lookup throws are skipped.
std::optional<std::string> whichmodule(rt::runtime &rt, const rt::ref &obj, std::string_view qualname);

class pickler {
 public:
  typedef std::function<reduce_value(const rt::ref &)> reducer_t;

  explicit pickler(rt::runtime &rt);
  pickler(const pickler &) = delete;
  pickler &operator=(const pickler &) = delete;
  virtual ~pickler() = default;

  // encodes one object graph; the memo does not outlive the call
  std::string dumps(const rt::ref &obj);

  // consulted by kind after reducer_override declines
  std::unordered_map<rt::kind_t, reducer_t> dispatch_table;

 protected:
  // first look at every object that is not plain data; nullopt falls through to the default handling
  virtual std::optional<reduce_value> reducer_override(const rt::ref &obj);

  void save(const rt::ref &obj);
  // writes obj as a (module, qualname) reference, verified by identity
  void save_global(const rt::ref &obj);
  void save_reduce(const rt::ref &obj, const reduce_value &rv);

  [[nodiscard]] rt::ref builtin(std::string_view name) const;

  rt::runtime &rt;

 private:
  bool save_plain(const rt::ref &obj);
  void memoize(const rt::ref &obj);

  wire::writer out;
  std::unordered_map<const rt::object *, std::pair<uint64_t, rt::ref>> memo;
  std::set<const rt::object *> in_progress;
};

}

#endif //BPICKLE_LIB_PICKLE_PICKLER_H_
