#include <cloud/globals.h>

namespace bpickle::cloud {

std::shared_ptr<const name_set> global_extractor::extract(const std::shared_ptr<rt::code> &co) {
  {
    std::lock_guard<std::mutex> lk(mu);
    if (auto it = cache.find(co); it != cache.end())return it->second;
  }
  auto names = std::make_shared<name_set>();
  for (const rt::instruction &i : co->instructions) {
    switch (i.op) {
      case rt::opcode::load_global:
      case rt::opcode::store_global:
      case rt::opcode::delete_global:
        if (i.arg >= co->names.size())
          throw rt::error::value_error("global operand out of range in " + co->qualname);
        names->insert(co->names[i.arg]);
        break;
      default:break;
    }
  }
  for (const auto &nested : co->nested()) {
    auto inner = extract(nested);
    names->insert(inner->begin(), inner->end());
  }

  std::lock_guard<std::mutex> lk(mu);
  std::erase_if(cache, [](const auto &e) { return e.first.expired(); });
  // another thread may have got here first; both results are equal
  return cache.emplace(co, std::move(names)).first->second;
}

size_t global_extractor::cache_size() const {
  std::lock_guard<std::mutex> lk(mu);
  return std::count_if(cache.begin(), cache.end(), [](const auto &e) { return !e.first.expired(); });
}

name_set all_names(const rt::code &co) {
  name_set names(co.names.begin(), co.names.end());
  for (const auto &nested : co.nested()) names.merge(all_names(*nested));
  return names;
}

std::vector<std::shared_ptr<rt::module>> find_imported_submodules(const rt::runtime &rt, const rt::code &co,
                                                                  const std::vector<rt::ref> &top_level_dependencies) {
  std::vector<std::shared_ptr<rt::module>> found;
  name_set names;
  bool names_ready = false;
  for (const rt::ref &dep : top_level_dependencies) {
    auto pkg = rt::as<rt::module>(dep);
    if (!pkg)continue;
    if (!names_ready) {
      names = all_names(co);
      names_ready = true;
    }
    const std::string prefix = pkg->name + ".";
    for (const auto&[name, m] : rt.modules()) {
      if (!name.starts_with(prefix))continue;
      const auto tokens = util::split_dotted(std::string_view(name).substr(prefix.size()));
      if (!std::all_of(tokens.begin(), tokens.end(), [&](std::string_view t) { return names.contains(t); }))continue;
      if (std::find(found.begin(), found.end(), m) == found.end())found.push_back(m);
    }
  }
  return found;
}

}
