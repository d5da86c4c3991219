#ifndef BPICKLE_LIB_UTIL_UTIL_H_
#define BPICKLE_LIB_UTIL_UTIL_H_

#include <string>
#include <string_view>
#include <stdexcept>
#include <sstream>
#include <array>
#include <vector>
#include <algorithm>
#include <fstream>
#include <streambuf>
#include <optional>

namespace bpickle::util {

std::string load_file(std::string_view path);
void save_file(std::string_view path, std::string_view content);

std::string_view itr_sv(std::string_view::iterator begin, std::string_view::iterator end);
std::string_view trim(std::string_view s);

// splits "a.b.c" into {"a","b","c"}
std::vector<std::string_view> split_dotted(std::string_view s);

std::optional<std::string> get_env(const char *name);

template<typename... T>
constexpr auto make_array(T &&... values) ->
std::array<
    typename std::decay<
        typename std::common_type<T...>::type>::type,
    sizeof...(T)> {
  return std::array<
      typename std::decay<
          typename std::common_type<T...>::type>::type,
      sizeof...(T)>{std::forward<T>(values)...};
}

namespace chars {

bool has_escaped_mnemonic(char c);
char escaped_mnemonic(char c);
bool is_valid_mnemonic(char c);
char parse_mnemonic(char c);
}
}

#define BPICKLE_STRINGIFY(x) #x
#define BPICKLE_TOSTRING(x) BPICKLE_STRINGIFY(x)
#define BPICKLE_AT __FILE__ ":" BPICKLE_TOSTRING(__LINE__)
#define BPICKLE_THROW_INTERNAL_ERROR throw std::runtime_error( BPICKLE_AT ": internal_error" );

#endif //BPICKLE_LIB_UTIL_UTIL_H_
