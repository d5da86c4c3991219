#include <cloud/function_state.h>
#include <pickle/error.h>

namespace bpickle::cloud {

function_capsule::function_capsule(rt::runtime &rt, global_extractor &extractor) : rt(rt), extractor(extractor) {}

std::shared_ptr<rt::dict> function_capsule::referenced_globals(const rt::function &f) const {
  auto subset = std::make_shared<rt::dict>();
  if (!f.globals)return subset;
  const auto names = extractor.extract(f.co);
  for (const std::string &n : *names)
    if (rt::ref v = f.globals->get(n))subset->set(n, v);
  return subset;
}

rt::ref function_capsule::capture(const std::shared_ptr<rt::function> &f) const {
  auto globals = referenced_globals(*f);

  auto attrs = std::make_shared<rt::dict>();
  attrs->set("__name__", rt::make_str(f->name));
  attrs->set("__qualname__", rt::make_str(f->qualname));
  attrs->set("__module__", f->module ? rt::make_str(*f->module) : rt::none());
  attrs->set("__doc__", f->doc ? f->doc : rt::none());
  attrs->set("__defaults__", rt::make_tuple(f->defaults));
  for (const auto&[k, v] : f->attrs)attrs->set(k, v);

  // a package reached through a global or a captured variable
  std::vector<rt::ref> deps;
  for (const auto&[k, v] : globals->entries)deps.push_back(v);
  for (const auto &c : f->closure)
    if (!c->empty())deps.push_back(c->contents);
  auto submodules = find_imported_submodules(rt, *f->co, deps);

  std::vector<rt::ref> cells(f->closure.begin(), f->closure.end());
  return rt::make_tuple({attrs, globals, rt::make_tuple(std::move(cells)),
                         rt::make_tuple(std::vector<rt::ref>(submodules.begin(), submodules.end()))});
}

std::shared_ptr<rt::function> function_capsule::make_shell(const std::shared_ptr<rt::code> &co,
                                                           const std::shared_ptr<rt::dict> &base_globals,
                                                           int64_t n_cells) const {
  if (n_cells < 0 || size_t(n_cells) != co->freevars.size())
    throw pickle::error::corruption(co->qualname + " captures " + std::to_string(co->freevars.size())
                                        + " variables, the stream carries " + std::to_string(n_cells) + " cells");
  std::vector<std::shared_ptr<rt::cell>> closure;
  for (int64_t i = 0; i < n_cells; ++i)closure.push_back(std::make_shared<rt::cell>());
  return rt.make_function(co, base_globals, co->qualname, std::move(closure));
}

void function_capsule::restore(const std::shared_ptr<rt::function> &f, const rt::ref &state) const {
  auto parts = rt::as<rt::tuple>(state);
  if (!parts || parts->items.size() != 4)throw pickle::error::corruption("malformed state for " + f->qualname);
  auto attrs = rt::as<rt::dict>(parts->items[0]);
  auto globals = rt::as<rt::dict>(parts->items[1]);
  auto cells = rt::as<rt::tuple>(parts->items[2]);
  // the submodules were imported while decoding the fourth slot; nothing is left to apply
  auto submodules = rt::as<rt::tuple>(parts->items[3]);
  if (!attrs || !globals || !cells || !submodules)
    throw pickle::error::corruption("malformed state for " + f->qualname);

  for (const auto&[k, v] : attrs->entries)rt.setattr(f, rt::expect<rt::string>(k, "function attribute name")->v, v);
  for (const auto&[k, v] : globals->entries)f->globals->set(k, v);

  if (cells->items.size() != f->closure.size())
    throw pickle::error::corruption(f->qualname + " expects " + std::to_string(f->closure.size())
                                        + " closure cells, got " + std::to_string(cells->items.size()));
  for (size_t i = 0; i < f->closure.size(); ++i)
    f->closure[i] = rt::expect<rt::cell>(cells->items[i], "closure cell");
}

}
