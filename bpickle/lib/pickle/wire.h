#ifndef BPICKLE_LIB_PICKLE_WIRE_H_
#define BPICKLE_LIB_PICKLE_WIRE_H_

#include <pickle/error.h>
#include <cstdint>
#include <string>
#include <string_view>

namespace bpickle::pickle::wire {

static constexpr uint8_t PROTOCOL = 1;

enum class tag : uint8_t {
  proto = 0x80,
  stop = '.',
  none = 'N',
  ellipsis = 'E',
  not_implemented = 'X',
  true_ = 'T',
  false_ = 'F',
  integer = 'I',
  floating = 'G',
  string = 'S',
  tuple = 't',
  list = 'l',
  dict = 'd',
  global = 'c',
  reduce = 'R',
  memo_get = 'h'
};
std::string_view tag_to_string(tag t);

// REDUCE trailer flags
static constexpr uint8_t HAS_STATE = 0x01;
static constexpr uint8_t HAS_RESTORE = 0x02;

/**
 * Output buffer. Integers are written as 8 bytes little-endian, strings as a length followed by the raw bytes.
 * */
class writer {
 public:
  void write_byte(uint8_t b) { buffer.push_back(char(b)); }
  void write_tag(tag t) { write_byte(uint8_t(t)); }
  void write_int64(int64_t v) { write_uint64(uint64_t(v)); }
  void write_uint64(uint64_t v);
  void write_double(double v);
  void write_string(std::string_view s);
  [[nodiscard]] size_t size() const { return buffer.size(); }
  std::string finish() { return std::move(buffer); }
 private:
  std::string buffer;
};

// Input buffer over bytes owned by the caller. Reading past the end throws error::corruption.
class reader {
 public:
  explicit reader(std::string_view data) : data(data) {}
  [[nodiscard]] bool empty() const { return pos >= data.size(); }
  [[nodiscard]] size_t position() const { return pos; }
  uint8_t read_byte();
  tag read_tag();
  int64_t read_int64() { return int64_t(read_uint64()); }
  uint64_t read_uint64();
  double read_double();
  std::string read_string();
 private:
  std::string_view data;
  size_t pos = 0;
};

}

#endif //BPICKLE_LIB_PICKLE_WIRE_H_
