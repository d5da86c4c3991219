#include <pickle/wire.h>
#include <bit>

namespace bpickle::pickle::wire {

std::string_view tag_to_string(tag t) {
  switch (t) {
    case tag::proto:return "PROTO";
    case tag::stop:return "STOP";
    case tag::none:return "NONE";
    case tag::ellipsis:return "ELLIPSIS";
    case tag::not_implemented:return "NOT_IMPLEMENTED";
    case tag::true_:return "TRUE";
    case tag::false_:return "FALSE";
    case tag::integer:return "INT";
    case tag::floating:return "FLOAT";
    case tag::string:return "STR";
    case tag::tuple:return "TUPLE";
    case tag::list:return "LIST";
    case tag::dict:return "DICT";
    case tag::global:return "GLOBAL";
    case tag::reduce:return "REDUCE";
    case tag::memo_get:return "MEMO_GET";
  }
  return "UNKNOWN";
}

void writer::write_uint64(uint64_t v) {
  for (int i = 0; i < 8; ++i) {
    write_byte(uint8_t(v & 0xFF));
    v >>= 8;
  }
}

void writer::write_double(double v) {
  write_uint64(std::bit_cast<uint64_t>(v));
}

void writer::write_string(std::string_view s) {
  write_uint64(s.size());
  buffer.append(s);
}

uint8_t reader::read_byte() {
  if (pos >= data.size())throw error::corruption("unexpected end of data");
  return uint8_t(data[pos++]);
}

tag reader::read_tag() {
  const uint8_t b = read_byte();
  switch (tag(b)) {
    case tag::proto:
    case tag::stop:
    case tag::none:
    case tag::ellipsis:
    case tag::not_implemented:
    case tag::true_:
    case tag::false_:
    case tag::integer:
    case tag::floating:
    case tag::string:
    case tag::tuple:
    case tag::list:
    case tag::dict:
    case tag::global:
    case tag::reduce:
    case tag::memo_get:return tag(b);
  }
  throw error::corruption("invalid tag " + std::to_string(b) + " at offset " + std::to_string(pos - 1));
}

uint64_t reader::read_uint64() {
  uint64_t v = 0;
  for (int i = 0; i < 8; ++i)v |= uint64_t(read_byte()) << (8 * i);
  return v;
}

double reader::read_double() {
  return std::bit_cast<double>(read_uint64());
}

std::string reader::read_string() {
  const uint64_t n = read_uint64();
  if (n > data.size() - pos)throw error::corruption("string length " + std::to_string(n) + " exceeds the input");
  std::string s(data.substr(pos, n));
  pos += n;
  return s;
}

}
