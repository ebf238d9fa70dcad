#include "stackvm/compiler.hpp"

#include <set>
#include <stdexcept>
#include <utility>

namespace stackvm {

std::int64_t Compiler::address_of(const std::string& name) {
  auto it = var2addr_.find(name);
  if (it != var2addr_.end()) {
    return it->second;
  }
  const std::int64_t addr = static_cast<std::int64_t>(var2addr_.size());
  var2addr_[name] = addr;
  return addr;
}

// Assigns addresses to the names in `e` in source order without emitting code.
void Compiler::reserve_addresses(const Expr& e) {
  if (e.kind == Expr::Kind::Var) {
    address_of(static_cast<const VarExpr&>(e).name);
  } else if (e.kind == Expr::Kind::Binary) {
    const auto& bin = static_cast<const BinaryExpr&>(e);
    reserve_addresses(*bin.a);
    reserve_addresses(*bin.b);
  }
}

std::string Compiler::new_label(const std::string& prefix) {
  return prefix + "_" + std::to_string(label_counter_++);
}

void Compiler::emit(Opcode op) { code_.push_back(static_cast<std::uint8_t>(op)); }

void Compiler::emit_push(std::int64_t value) {
  emit(Opcode::Push);
  append_i64(code_, value);
}

// Branch targets travel on the operand stack: PUSH <target>; JMP / JMP_IF.
void Compiler::emit_jump(Opcode op, const std::string& label) {
  emit(Opcode::Push);
  unresolved_.push_back({code_.size(), label});
  append_i64(code_, 0);
  emit(op);
}

// JMP_IF branches on a non-zero condition, so the condition is inverted
// first with `== 0`.
void Compiler::emit_branch_if_false(const std::string& label) {
  emit_push(0);
  emit(Opcode::Equal);
  emit_jump(Opcode::JumpIf, label);
}

void Compiler::mark_label(const std::string& name) { labels_[name] = code_.size(); }

void Compiler::patch_jumps() {
  for (const UnresolvedJump& j : unresolved_) {
    auto it = labels_.find(j.label);
    if (it == labels_.end()) {
      throw std::runtime_error("undefined label");
    }
    write_i64(code_, j.operand_offset, static_cast<std::int64_t>(it->second));
  }
  unresolved_.clear();
}

void Compiler::compile_block(const Block& b) {
  for (const StmtPtr& st : b.stmts) {
    compile_stmt(*st);
  }
}

void Compiler::compile_store(const std::string& name, const Expr& e) {
  const std::int64_t addr = address_of(name);
  compile_expr(e);
  emit_push(addr);
  emit(Opcode::Store);
}

void Compiler::compile_stmt(const Stmt& st) {
  switch (st.kind) {
    case Stmt::Kind::Let: {
      const auto& let = static_cast<const LetStmt&>(st);
      compile_store(let.name, *let.e);
      return;
    }
    case Stmt::Kind::Assign: {
      const auto& assign = static_cast<const AssignStmt&>(st);
      compile_store(assign.name, *assign.e);
      return;
    }
    case Stmt::Kind::If: {
      const auto& ifs = static_cast<const IfStmt&>(st);
      const std::string else_l = new_label("if_else");
      const std::string end_l = new_label("if_end");
      compile_expr(*ifs.cond);
      emit_branch_if_false(else_l);
      compile_block(ifs.then_block);
      emit_jump(Opcode::Jump, end_l);
      mark_label(else_l);
      compile_block(ifs.else_block);
      mark_label(end_l);
      return;
    }
    case Stmt::Kind::While: {
      const auto& loop = static_cast<const WhileStmt&>(st);
      const std::string end_l = new_label("while_end");
      const std::int64_t start = static_cast<std::int64_t>(code_.size());
      compile_expr(*loop.cond);
      emit_branch_if_false(end_l);
      compile_block(loop.body);
      emit_push(start);
      emit(Opcode::Jump);
      mark_label(end_l);
      return;
    }
    case Stmt::Kind::Print: {
      const auto& print = static_cast<const PrintStmt&>(st);
      compile_expr(*print.e);
      emit(Opcode::Print);
      return;
    }
  }
  throw std::runtime_error("unknown Stmt node");
}

void Compiler::compile_expr(const Expr& e) {
  switch (e.kind) {
    case Expr::Kind::Number:
      emit_push(static_cast<const NumberExpr&>(e).value);
      return;
    case Expr::Kind::Var:
      emit_push(address_of(static_cast<const VarExpr&>(e).name));
      emit(Opcode::Load);
      return;
    case Expr::Kind::Binary: {
      const auto& bin = static_cast<const BinaryExpr&>(e);
      if (bin.op == BinOp::Greater) {
        // a > b  ==>  b < a
        reserve_addresses(*bin.a);
        compile_expr(*bin.b);
        compile_expr(*bin.a);
        emit(Opcode::Less);
        return;
      }
      compile_expr(*bin.a);
      compile_expr(*bin.b);
      switch (bin.op) {
        case BinOp::Add:
          emit(Opcode::Add);
          return;
        case BinOp::Sub:
          emit(Opcode::Sub);
          return;
        case BinOp::Mul:
          emit(Opcode::Mul);
          return;
        case BinOp::Div:
          emit(Opcode::Div);
          return;
        case BinOp::Equals:
          emit(Opcode::Equal);
          return;
        case BinOp::Less:
        case BinOp::Greater:
          emit(Opcode::Less);
          return;
      }
      throw std::runtime_error("unknown binary operator");
    }
  }
  throw std::runtime_error("unknown Expr node");
}

Bytecode Compiler::compile(Block program) {
  compile_block(program);
  emit(Opcode::Halt);
  patch_jumps();
  Bytecode out = std::move(code_);
  code_.clear();
  labels_.clear();
  return out;
}

Bytecode compile_program(Block program) {
  Compiler compiler;
  return compiler.compile(std::move(program));
}

namespace {

void check_expr(const Expr& e, const std::set<std::string>& declared, std::vector<std::string>& errors) {
  switch (e.kind) {
    case Expr::Kind::Number:
      return;
    case Expr::Kind::Var: {
      const std::string& name = static_cast<const VarExpr&>(e).name;
      if (declared.count(name) == 0) {
        errors.push_back("use of undeclared variable '" + name + "'");
      }
      return;
    }
    case Expr::Kind::Binary: {
      const auto& bin = static_cast<const BinaryExpr&>(e);
      check_expr(*bin.a, declared, errors);
      check_expr(*bin.b, declared, errors);
      return;
    }
  }
}

void check_block(const Block& b, std::set<std::string>& declared, std::vector<std::string>& errors) {
  for (const StmtPtr& st : b.stmts) {
    switch (st->kind) {
      case Stmt::Kind::Let: {
        const auto& let = static_cast<const LetStmt&>(*st);
        check_expr(*let.e, declared, errors);
        declared.insert(let.name);
        break;
      }
      case Stmt::Kind::Assign: {
        const auto& assign = static_cast<const AssignStmt&>(*st);
        check_expr(*assign.e, declared, errors);
        if (declared.count(assign.name) == 0) {
          errors.push_back("assignment to undeclared variable '" + assign.name + "'");
        }
        break;
      }
      case Stmt::Kind::If: {
        const auto& ifs = static_cast<const IfStmt&>(*st);
        check_expr(*ifs.cond, declared, errors);
        check_block(ifs.then_block, declared, errors);
        check_block(ifs.else_block, declared, errors);
        break;
      }
      case Stmt::Kind::While: {
        const auto& loop = static_cast<const WhileStmt&>(*st);
        check_expr(*loop.cond, declared, errors);
        check_block(loop.body, declared, errors);
        break;
      }
      case Stmt::Kind::Print:
        check_expr(*static_cast<const PrintStmt&>(*st).e, declared, errors);
        break;
    }
  }
}

}  // namespace

ValidationResult check_declarations(const Block& program) {
  ValidationResult out;
  std::set<std::string> declared;
  check_block(program, declared, out.errors);
  out.is_valid = out.errors.empty();
  return out;
}

}  // namespace stackvm
