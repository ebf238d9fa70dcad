#include "stackvm/pipeline.hpp"

#include <utility>

#include "stackvm/parser.hpp"

namespace stackvm {

CompileResult compile_source(const std::string& source, bool check_vars) {
  CompileResult out;
  ParseResult parsed = parse_program(source);
  if (parsed.is_error) {
    out.is_error = true;
    out.err = parsed.err;
    return out;
  }

  if (check_vars) {
    const ValidationResult vr = check_declarations(parsed.program);
    if (!vr.is_valid) {
      out.is_error = true;
      out.err = Err{ErrCode::Name, vr.errors.front()};
      return out;
    }
  }

  Compiler compiler;
  out.code = compiler.compile(std::move(parsed.program));
  out.vars = compiler.variables();
  return out;
}

}  // namespace stackvm
