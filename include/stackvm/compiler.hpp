#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

#include "stackvm/ast.hpp"
#include "stackvm/bytecode.hpp"

namespace stackvm {

// Variable name -> memory address, assigned densely from 0 in order of first
// reference.
using VarTable = std::unordered_map<std::string, std::int64_t>;

class Compiler {
 public:
  // Always succeeds; the result ends with HALT.
  Bytecode compile(Block program);

  const VarTable& variables() const { return var2addr_; }

 private:
  struct UnresolvedJump {
    std::size_t operand_offset = 0;
    std::string label;
  };

  std::int64_t address_of(const std::string& name);
  void reserve_addresses(const Expr& e);
  std::string new_label(const std::string& prefix);

  void emit(Opcode op);
  void emit_push(std::int64_t value);
  void emit_jump(Opcode op, const std::string& label);
  void emit_branch_if_false(const std::string& label);
  void mark_label(const std::string& name);
  void patch_jumps();

  void compile_block(const Block& b);
  void compile_stmt(const Stmt& st);
  void compile_expr(const Expr& e);
  void compile_store(const std::string& name, const Expr& e);

  Bytecode code_;
  VarTable var2addr_;
  std::unordered_map<std::string, std::size_t> labels_;
  std::vector<UnresolvedJump> unresolved_;
  int label_counter_ = 0;
};

Bytecode compile_program(Block program);

struct ValidationResult {
  bool is_valid = false;
  std::vector<std::string> errors;
};

// Optional stricter pass: reports every read or assignment of a name that has
// not been introduced by an earlier `let`.
ValidationResult check_declarations(const Block& program);

}  // namespace stackvm
