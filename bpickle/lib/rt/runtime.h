#ifndef BPICKLE_LIB_RT_RUNTIME_H_
#define BPICKLE_LIB_RT_RUNTIME_H_

#include <rt/object.h>
#include <rt/code.h>
#include <unordered_map>

namespace bpickle::rt {

/**
 * One instance of the runtime: the loaded module table, the loaders of modules that can still be imported,
 * the builtin types and the logger registry.
 * Two runtime objects never share state, so a second runtime in the same process stands for a separate
 * worker process.
 * */
class runtime {
 public:
  typedef std::function<void(runtime &, module &)> loader_t;
  static constexpr std::string_view main_name = "__main__";

  runtime();
  runtime(const runtime &) = delete;
  runtime &operator=(const runtime &) = delete;

  // modules
  [[nodiscard]] const std::map<std::string, std::shared_ptr<module>, std::less<>> &modules() const { return modules_; }
  [[nodiscard]] std::shared_ptr<module> find_module(std::string_view name) const;
  std::shared_ptr<module> add_module(std::string_view name, module::origin_t origin = module::file);
  void remove_module(std::string_view name);
  void register_loader(std::string_view name, loader_t loader, module::origin_t origin = module::file);
  [[nodiscard]] bool is_importable(std::string_view name) const;
  std::shared_ptr<module> import_module(std::string_view name);
  std::shared_ptr<module> exec_module(std::string_view name, const std::shared_ptr<code> &body,
                                      module::origin_t origin = module::file);
  void exec_in(const std::shared_ptr<module> &m, const std::shared_ptr<code> &body);
  [[nodiscard]] std::shared_ptr<module> main_module() const { return main_; }
  [[nodiscard]] std::shared_ptr<module> builtins() const { return builtins_; }

  // dotted lookup "A.B.c" starting from a module; throws error::attribute_error
  ref lookup_qualified(const std::shared_ptr<module> &m, std::string_view qualname);

  // objects
  [[nodiscard]] std::shared_ptr<type> type_of(const ref &o) const;
  [[nodiscard]] std::shared_ptr<type> builtin_type(kind_t k) const;
  ref getattr(const ref &o, std::string_view name);
  std::optional<ref> try_getattr(const ref &o, std::string_view name);
  void setattr(const ref &o, std::string_view name, ref value);
  ref call(const ref &callable, args_t args);
  std::shared_ptr<logger> get_logger(std::string_view name);

  // definitions
  std::shared_ptr<type> make_class(std::string_view name, std::string_view qualname, std::string_view module,
                                   std::vector<std::shared_ptr<type>> bases = {}, attr_map attrs = {});
  std::shared_ptr<type> make_enum(std::string_view name, std::string_view qualname, std::string_view module,
                                  const std::vector<std::pair<std::string, ref>> &members);
  std::shared_ptr<function> make_function(const std::shared_ptr<code> &co, const std::shared_ptr<dict> &globals,
                                          std::string_view qualname,
                                          std::vector<std::shared_ptr<cell>> closure = {},
                                          std::vector<ref> defaults = {});
  std::shared_ptr<native_function> make_native(std::string_view name, native_function::impl_t impl,
                                               const std::shared_ptr<module> &owner = nullptr);

 private:
  ref run_frame(const function &f, args_t &args);
  ref bind_method(const ref &descriptor, const ref &self, const std::shared_ptr<type> &cls);
  ref call_type(const std::shared_ptr<type> &t, args_t &args);
  void install_builtins();
  void install_copyreg();

  std::map<std::string, std::shared_ptr<module>, std::less<>> modules_;
  std::map<std::string, std::pair<loader_t, module::origin_t>, std::less<>> loaders_;
  std::unordered_map<kind_t, std::shared_ptr<type>> builtin_types_;
  std::map<std::string, std::shared_ptr<logger>, std::less<>> loggers_;
  std::shared_ptr<module> builtins_, main_;
  size_t depth_ = 0;
};

// appends a member to an enumeration: binds the (name, value) pair and publishes it as a class attribute
std::shared_ptr<enum_member> add_enum_member(const std::shared_ptr<type> &t, std::string_view name, ref value);

}

#endif //BPICKLE_LIB_RT_RUNTIME_H_
