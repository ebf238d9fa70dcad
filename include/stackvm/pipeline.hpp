#pragma once

#include <string>

#include "stackvm/bytecode.hpp"
#include "stackvm/compiler.hpp"
#include "stackvm/errors.hpp"

namespace stackvm {

struct CompileResult {
  bool is_error = false;
  Bytecode code;
  VarTable vars;
  Err err{ErrCode::Parse, ""};
};

// Lexes, parses and compiles `source`. With `check_vars` set, names used
// before their `let` are rejected with ErrCode::Name.
CompileResult compile_source(const std::string& source, bool check_vars = false);

}  // namespace stackvm
