#ifndef BPICKLE_LIB_PICKLE_ERROR_H_
#define BPICKLE_LIB_PICKLE_ERROR_H_

#include <stdexcept>
#include <string>

namespace bpickle::pickle::error {

class t : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct pickling_error : public t { using t::t; };
struct unpickling_error : public t { using t::t; };

// no strategy knows how to encode the object
struct unsupported_object : public pickling_error { using pickling_error::pickling_error; };
// the object could be encoded but must not be (write-mode streams, coroutines)
struct refused_by_policy : public pickling_error { using pickling_error::pickling_error; };
// the byte stream decodes into something that cannot be rebuilt
struct corruption : public unpickling_error { using unpickling_error::unpickling_error; };

}

#endif //BPICKLE_LIB_PICKLE_ERROR_H_
