#include <util/util.h>
#include <cstdlib>

namespace bpickle::util {
std::string_view itr_sv(std::string_view::iterator begin, std::string_view::iterator end) {
  return std::string_view(begin, end - begin);
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && s.front() <= 32)s.remove_prefix(1);
  while (!s.empty() && s.back() <= 32)s.remove_suffix(1);
  return s;
}

std::vector<std::string_view> split_dotted(std::string_view s) {
  std::vector<std::string_view> parts;
  for (auto begin = s.begin();;) {
    auto end = std::find(begin, s.end(), '.');
    parts.push_back(itr_sv(begin, end));
    if (end == s.end())break;
    begin = end + 1;
  }
  return parts;
}

std::string load_file(std::string_view path) {
  std::ifstream t(std::string(path).c_str(), std::ios::binary);
  if (!t)throw std::runtime_error(std::string("cannot open ").append(path));
  return std::string((std::istreambuf_iterator<char>(t)),
                     std::istreambuf_iterator<char>());
}

void save_file(std::string_view path, std::string_view content) {
  std::ofstream t(std::string(path).c_str(), std::ios::binary);
  if (!t)throw std::runtime_error(std::string("cannot write ").append(path));
  t.write(content.data(), content.size());
}

std::optional<std::string> get_env(const char *name) {
  const char *v = std::getenv(name);
  if (v == nullptr)return {};
  return std::string(v);
}

namespace chars {
bool has_escaped_mnemonic(char c) {
  switch (c) {
    case '\'':
    case '\"':
    case '\\':
    case '\n':
    case '\r':
    case '\t':
    case '\b':
    case '\f':
    case '\a':
    case '\v':return true;
    default: return false;
  }
}

char escaped_mnemonic(char c) {
  switch (c) {
    case '\'':return c;
    case '\"':return c;
    case '\\':return c;
    case '\n':return 'n';
    case '\r':return 'r';
    case '\t':return 't';
    case '\b':return 'b';
    case '\f':return 'f';
    case '\a':return 'a';
    case '\v':return 'v';
    default: BPICKLE_THROW_INTERNAL_ERROR;
  }
}

bool is_valid_mnemonic(char c) {
  switch (c) {
    case '\'':
    case '\"':
    case '\\':
    case 'n':
    case 'r':
    case 't':
    case 'b':
    case 'f':
    case 'a':
    case 'v':return true;
    default: return false;
  }
}
char parse_mnemonic(char c) {
  switch (c) {
    case '\'':return c;
    case '\"':return c;
    case '\\':return c;
    case 'n':return '\n';
    case 'r':return '\r';
    case 't':return '\t';
    case 'b':return '\b';
    case 'f':return '\f';
    case 'a':return '\a';
    case 'v':return '\v';
    default: BPICKLE_THROW_INTERNAL_ERROR;
  }
}

}
}
