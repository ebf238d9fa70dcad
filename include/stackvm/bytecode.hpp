#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "stackvm/errors.hpp"

namespace stackvm {

enum class Opcode : std::uint8_t {
  Push = 0x01,
  Pop = 0x02,
  Add = 0x03,
  Sub = 0x04,
  Mul = 0x05,
  Div = 0x06,
  Load = 0x07,
  // Expects `..., value, address`: the address is popped first, then the
  // value. Hand-assembled code must push the value before the address.
  Store = 0x08,
  Jump = 0x09,
  JumpIf = 0x0A,
  Equal = 0x0B,
  Less = 0x0C,
  Print = 0x0D,
  LessEqual = 0x0E,
  GreaterEqual = 0x0F,
  Halt = 0xFF,
};

constexpr std::size_t kOperandSize = 8;

using Bytecode = std::vector<std::uint8_t>;

// Returns false for bytes that are not a known opcode.
bool opcode_from_byte(std::uint8_t byte, Opcode& out);
const char* opcode_name(Opcode op);
bool has_operand(Opcode op);

// Operands are little-endian two's-complement 64-bit integers.
void append_i64(Bytecode& code, std::int64_t value);
void write_i64(Bytecode& code, std::size_t offset, std::int64_t value);
std::int64_t read_i64(const Bytecode& code, std::size_t offset);

struct DecodedInstr {
  std::size_t offset = 0;
  Opcode op = Opcode::Halt;
  bool has_operand = false;
  std::int64_t operand = 0;
};

struct DecodeResult {
  bool is_error = false;
  std::vector<DecodedInstr> instrs;
  Err err{ErrCode::InvalidOpcode, ""};
};

DecodeResult decode_bytecode(const Bytecode& code);

// Checks that every PUSH feeding a JMP / JMP_IF names the offset of a decoded
// instruction.
bool jump_targets_valid(const std::vector<DecodedInstr>& instrs);

std::string format_instr(const DecodedInstr& ins);
std::string disassemble(const Bytecode& code);

}  // namespace stackvm
