#include "stackvm/bytecode.hpp"

#include <set>
#include <sstream>

namespace stackvm {

bool opcode_from_byte(std::uint8_t byte, Opcode& out) {
  switch (byte) {
    case 0x01:
    case 0x02:
    case 0x03:
    case 0x04:
    case 0x05:
    case 0x06:
    case 0x07:
    case 0x08:
    case 0x09:
    case 0x0A:
    case 0x0B:
    case 0x0C:
    case 0x0D:
    case 0x0E:
    case 0x0F:
    case 0xFF:
      out = static_cast<Opcode>(byte);
      return true;
    default:
      return false;
  }
}

const char* opcode_name(Opcode op) {
  switch (op) {
    case Opcode::Push:
      return "PUSH";
    case Opcode::Pop:
      return "POP";
    case Opcode::Add:
      return "ADD";
    case Opcode::Sub:
      return "SUB";
    case Opcode::Mul:
      return "MUL";
    case Opcode::Div:
      return "DIV";
    case Opcode::Load:
      return "LOAD";
    case Opcode::Store:
      return "STORE";
    case Opcode::Jump:
      return "JMP";
    case Opcode::JumpIf:
      return "JMP_IF";
    case Opcode::Equal:
      return "EQ";
    case Opcode::Less:
      return "LT";
    case Opcode::Print:
      return "PRINT";
    case Opcode::LessEqual:
      return "LE";
    case Opcode::GreaterEqual:
      return "GE";
    case Opcode::Halt:
      return "HALT";
  }
  return "?";
}

bool has_operand(Opcode op) { return op == Opcode::Push; }

void append_i64(Bytecode& code, std::int64_t value) {
  const std::uint64_t bits = static_cast<std::uint64_t>(value);
  for (std::size_t i = 0; i < kOperandSize; ++i) {
    code.push_back(static_cast<std::uint8_t>((bits >> (8 * i)) & 0xFFu));
  }
}

void write_i64(Bytecode& code, std::size_t offset, std::int64_t value) {
  const std::uint64_t bits = static_cast<std::uint64_t>(value);
  for (std::size_t i = 0; i < kOperandSize; ++i) {
    code[offset + i] = static_cast<std::uint8_t>((bits >> (8 * i)) & 0xFFu);
  }
}

std::int64_t read_i64(const Bytecode& code, std::size_t offset) {
  std::uint64_t bits = 0;
  for (std::size_t i = 0; i < kOperandSize; ++i) {
    bits |= static_cast<std::uint64_t>(code[offset + i]) << (8 * i);
  }
  return static_cast<std::int64_t>(bits);
}

DecodeResult decode_bytecode(const Bytecode& code) {
  DecodeResult out;
  std::size_t pc = 0;
  while (pc < code.size()) {
    const std::uint8_t byte = code[pc];
    DecodedInstr ins;
    ins.offset = pc;
    if (!opcode_from_byte(byte, ins.op)) {
      out.is_error = true;
      out.err = Err{ErrCode::InvalidOpcode, "invalid opcode at offset " + std::to_string(pc), byte};
      return out;
    }
    pc += 1;
    if (has_operand(ins.op)) {
      if (pc + kOperandSize > code.size()) {
        out.is_error = true;
        out.err = Err{ErrCode::InvalidOpcode, "truncated operand at offset " + std::to_string(ins.offset), byte};
        return out;
      }
      ins.has_operand = true;
      ins.operand = read_i64(code, pc);
      pc += kOperandSize;
    }
    out.instrs.push_back(ins);
  }
  return out;
}

bool jump_targets_valid(const std::vector<DecodedInstr>& instrs) {
  std::set<std::int64_t> boundaries;
  for (const DecodedInstr& ins : instrs) {
    boundaries.insert(static_cast<std::int64_t>(ins.offset));
  }
  for (std::size_t i = 0; i < instrs.size(); ++i) {
    const Opcode op = instrs[i].op;
    if (op != Opcode::Jump && op != Opcode::JumpIf) {
      continue;
    }
    if (i == 0 || instrs[i - 1].op != Opcode::Push) {
      return false;
    }
    if (boundaries.count(instrs[i - 1].operand) == 0) {
      return false;
    }
  }
  return true;
}

std::string format_instr(const DecodedInstr& ins) {
  std::ostringstream out;
  out << ins.offset << ": " << opcode_name(ins.op);
  if (ins.has_operand) {
    out << " " << ins.operand;
  }
  return out.str();
}

std::string disassemble(const Bytecode& code) {
  const DecodeResult decoded = decode_bytecode(code);
  std::ostringstream out;
  for (const DecodedInstr& ins : decoded.instrs) {
    out << format_instr(ins) << "\n";
  }
  if (decoded.is_error) {
    out << "; " << decoded.err.message << "\n";
  }
  return out.str();
}

}  // namespace stackvm
