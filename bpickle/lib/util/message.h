#ifndef BPICKLE_LIB_UTIL_MESSAGE_H_
#define BPICKLE_LIB_UTIL_MESSAGE_H_
#include <string>
#include <iostream>
#include <util/util.h>
namespace bpickle::util::message {

struct base {
  virtual void print(std::ostream &) const = 0;
  virtual void link_file(std::string_view file, std::string_view filename = "source.basm") = 0;
  virtual ~base() = default;
};

namespace style {

static constexpr std::string_view bold = "\e[1m";
static constexpr std::string_view clear = "\e[0m";

struct error {
  static constexpr std::string_view name = "error";
  static constexpr std::string_view escape = "\e[31m";
};

struct note {
  static constexpr std::string_view name = "note";
  static constexpr std::string_view escape = "\e[36m";
};

}

template<typename Style>
struct styled_string : public virtual base {
  std::string what;
  styled_string(std::string_view what) : what(what) {}
  void print(std::ostream &os) const final {
    os << Style::escape << Style::name << ": " << style::clear << what << std::endl;
  }
  void link_file(std::string_view, std::string_view) final {}
};
typedef styled_string<style::error> error_string;
typedef styled_string<style::note> note_string;

template<typename Style>
struct report_token : public virtual base {

  std::string_view token, file, filename;
  report_token(std::string_view token, std::string_view file, std::string_view filename)
      : token(token), file(file), filename(filename) {}
  report_token(std::string_view token)
      : token(token) {}
  void link_file(std::string_view file, std::string_view filename) final {
    if (token.begin() >= file.begin() && token.end() <= file.end()) {
      this->file = file;
      this->filename = filename;
    }
  }

  virtual void describe(std::ostream &os) const = 0;
  void print(std::ostream &os) const final {
    constexpr std::string_view sep = ":";
    constexpr std::string_view ssep = ": ";
    std::string_view tk = token;
    std::size_t posy = 0, posx = 0;
    const bool located = !file.empty() && tk.begin() >= file.begin() && tk.end() <= file.end();
    os << style::bold;
    if (located) {
      posy = std::count(file.begin(), tk.begin(), 10) + 1;
      posx = std::distance(std::find(std::string_view::const_reverse_iterator(tk.begin()), file.crend(), 10).base(),
                           tk.begin()) + 1;
      os << filename << sep << posy << sep << posx << ssep;
    }
    os << Style::escape << Style::name << ssep << style::clear;
    describe(os);
    os << std::endl;
    if (located) {
      auto line_begin = tk.begin() - (posx - 1);
      auto it_endline = std::find(tk.begin(), file.end(), 10);
      if (it_endline < tk.end())tk = itr_sv(tk.begin(), it_endline);
      for (int w = int(5) - int(std::to_string(posy).size()); w > 0; w--)os << ' ';
      os << posy << " | " << itr_sv(line_begin, tk.begin()) << style::bold << Style::escape << tk
         << style::clear << itr_sv(tk.end(), it_endline) << std::endl;
      os << "      | " << std::string(posx - 1, ' ') << style::bold << Style::escape << "^";
      for (int w = int(tk.size()) - 1; w > 0; w--)os << '~';
      os << style::clear << std::endl;
    }
  }
}; // virtual class
typedef report_token<style::error> error_token;

template<typename Style>
struct report_token_front_back : public report_token<Style> {
  std::string front, back;
  typedef report_token<Style> base_rt;
  report_token_front_back(std::string_view front,
                          std::string_view token,
                          std::string_view back,
                          std::string_view file = "",
                          std::string_view filename = "") : base_rt(token, file, filename), front(front), back(back) {}
  void describe(std::ostream &os) const final {
    os << front;
    if (!front.empty() && front.back() != ' ')os << " ";
    os << style::bold << base_rt::token << style::clear;
    if (!back.empty() && back.front() != ' ')os << " ";
    os << back;
  }
};
typedef report_token_front_back<style::error> error_report_token_front_back;

}
#endif //BPICKLE_LIB_UTIL_MESSAGE_H_
