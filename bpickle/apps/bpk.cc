#include <cloud/cloud.h>
#include <rt/parse_asm.h>
#include <util/message.h>
#include <util/util.h>
#include <cstring>

using namespace bpickle;

std::string_view get_arg(int argc, const char *argv[], std::string_view argname, std::string_view on_fail) {
  auto it = std::find_if(argv, argv + argc, [argname](const char *p) { return std::strcmp(p, argname.data()) == 0; });
  if (it == argv + argc)return on_fail;
  if (it == argv + argc - 1)return on_fail;
  return it[1];
}

bool has_flag(int argc, const char *argv[], std::string_view flag) {
  return std::find_if(argv, argv + argc, [flag](const char *p) { return flag == p; }) != argv + argc;
}

// integers following -call
rt::args_t call_args(int argc, const char *argv[]) {
  rt::args_t args;
  auto it = std::find_if(argv, argv + argc, [](const char *p) { return std::strcmp(p, "-call") == 0; });
  if (it == argv + argc)return args;
  for (++it; it != argv + argc; ++it) {
    try {
      args.push_back(rt::make_int(std::stoll(*it)));
    } catch (const std::logic_error &) {
      throw std::runtime_error(std::string("-call expects integers, got ").append(*it));
    }
  }
  return args;
}

void dump(std::string_view source_path, std::string_view global, std::string_view target) {
  rt::runtime rt;
  cloud::engine engine(rt);
  std::string source = util::load_file(source_path);
  std::cerr << "[ Running " << source_path << " as " << rt::runtime::main_name << " ]" << std::endl;
  try {
    rt.exec_in(rt.main_module(), rt::parse_asm::parse_module(source, source_path));
  } catch (util::message::base &e) {
    e.link_file(source, source_path);
    e.print(std::cerr);
    throw;
  }
  const std::string bytes = engine.dumps(rt.lookup_qualified(rt.main_module(), global));
  util::save_file(target, bytes);
  std::cerr << "[ Pickled " << global << " into " << bytes.size() << " bytes ]" << std::endl;
}

void load(std::string_view source, int argc, const char *argv[]) {
  rt::runtime rt;
  cloud::engine engine(rt);
  rt::ref obj = engine.loads(util::load_file(source));
  if (has_flag(argc, argv, "-call"))obj = rt.call(obj, call_args(argc, argv));
  std::cout << rt::repr(obj) << std::endl;
}

int main(int argc, const char *argv[]) {
  try {
    if (has_flag(argc, argv, "-load")) {
      load(get_arg(argc, argv, "-load", "/tmp/file.bpk"), argc, argv);
      return 0;
    }
    if (argc < 2) {
      util::message::error_string("usage: bpk <file.basm> -f <global> [-o <out>] | bpk -load <in> [-call n ...]")
          .print(std::cerr);
      return 1;
    }
    dump(get_arg(argc, argv, argv[0], "/tmp/file.basm"), get_arg(argc, argv, "-f", "main"),
         get_arg(argc, argv, "-o", "/tmp/file.bpk"));
  } catch (const rt::parse_asm::error::t &) {
    return 1;
  } catch (const std::exception &e) {
    util::message::error_string(e.what()).print(std::cerr);
    return 1;
  }
  return 0;
}
