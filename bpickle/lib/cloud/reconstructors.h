#ifndef BPICKLE_LIB_CLOUD_RECONSTRUCTORS_H_
#define BPICKLE_LIB_CLOUD_RECONSTRUCTORS_H_

#include <rt/runtime.h>

namespace bpickle::cloud {

class engine;

// the class whose presence in a cell marks it empty
static constexpr std::string_view EMPTY_CELL_VALUE = "_empty_cell_value";

/**
 * Creates the _bpickle module: the constructors and state setters the cloud pickler names in its
 * reduce records. Loading a stream that uses them needs an engine on the loading runtime too.
 * */
std::shared_ptr<rt::module> install_reconstructors(engine &e);

// five bytes per instruction: opcode, then the operand as 32 bit little endian
std::string pack_instructions(const std::vector<rt::instruction> &instructions);
std::vector<rt::instruction> unpack_instructions(std::string_view packed);

}

#endif //BPICKLE_LIB_CLOUD_RECONSTRUCTORS_H_
