#pragma once

#include <cstdint>
#include <string>

namespace stackvm {

enum class ErrCode {
  Lex,
  IntOverflow,
  Parse,
  Name,
  StackUnderflow,
  StackOverflow,
  InvalidOpcode,
  OutOfMemory,
  ZeroDiv,
};

inline const char* err_code_name(ErrCode code) {
  switch (code) {
    case ErrCode::Lex:
      return "LexError";
    case ErrCode::IntOverflow:
      return "IntOverflowError";
    case ErrCode::Parse:
      return "ParseError";
    case ErrCode::Name:
      return "NameError";
    case ErrCode::StackUnderflow:
      return "StackUnderflow";
    case ErrCode::StackOverflow:
      return "StackOverflow";
    case ErrCode::InvalidOpcode:
      return "InvalidOpcode";
    case ErrCode::OutOfMemory:
      return "OutOfMemory";
    case ErrCode::ZeroDiv:
      return "ZeroDivisionError";
  }
  return "InvalidOpcode";
}

// detail holds the offending opcode byte (InvalidOpcode) or address
// (OutOfMemory); it is zero for the other codes.
struct Err {
  ErrCode code;
  std::string message;
  std::int64_t detail = 0;
};

}  // namespace stackvm
