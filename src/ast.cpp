#include "stackvm/ast.hpp"

#include <cstddef>
#include <sstream>
#include <stdexcept>

namespace stackvm {

namespace {

void write_expr(std::ostringstream& out, const Expr& e);
void write_block(std::ostringstream& out, const Block& b);

void write_stmt(std::ostringstream& out, const Stmt& st) {
  switch (st.kind) {
    case Stmt::Kind::Let: {
      const auto& let = static_cast<const LetStmt&>(st);
      out << "let " << let.name << " = ";
      write_expr(out, *let.e);
      out << ";";
      return;
    }
    case Stmt::Kind::Assign: {
      const auto& assign = static_cast<const AssignStmt&>(st);
      out << assign.name << " = ";
      write_expr(out, *assign.e);
      out << ";";
      return;
    }
    case Stmt::Kind::If: {
      const auto& ifs = static_cast<const IfStmt&>(st);
      out << "if ";
      write_expr(out, *ifs.cond);
      out << " ";
      write_block(out, ifs.then_block);
      if (!ifs.else_block.stmts.empty()) {
        out << " else ";
        write_block(out, ifs.else_block);
      }
      return;
    }
    case Stmt::Kind::While: {
      const auto& loop = static_cast<const WhileStmt&>(st);
      out << "while ";
      write_expr(out, *loop.cond);
      out << " ";
      write_block(out, loop.body);
      return;
    }
    case Stmt::Kind::Print: {
      const auto& print = static_cast<const PrintStmt&>(st);
      out << "print ";
      write_expr(out, *print.e);
      out << ";";
      return;
    }
  }
  throw std::runtime_error("unknown Stmt node");
}

void write_block(std::ostringstream& out, const Block& b) {
  out << "(";
  for (std::size_t i = 0; i < b.stmts.size(); ++i) {
    out << (i == 0 ? "" : " ");
    write_stmt(out, *b.stmts[i]);
  }
  out << ")";
}

void write_expr(std::ostringstream& out, const Expr& e) {
  switch (e.kind) {
    case Expr::Kind::Number:
      out << static_cast<const NumberExpr&>(e).value;
      return;
    case Expr::Kind::Var:
      out << static_cast<const VarExpr&>(e).name;
      return;
    case Expr::Kind::Binary: {
      const auto& bin = static_cast<const BinaryExpr&>(e);
      out << "(";
      write_expr(out, *bin.a);
      out << " " << bin_op_symbol(bin.op) << " ";
      write_expr(out, *bin.b);
      out << ")";
      return;
    }
  }
  throw std::runtime_error("unknown Expr node");
}

}  // namespace

const char* bin_op_symbol(BinOp op) {
  switch (op) {
    case BinOp::Add:
      return "+";
    case BinOp::Sub:
      return "-";
    case BinOp::Mul:
      return "*";
    case BinOp::Div:
      return "/";
    case BinOp::Equals:
      return "==";
    case BinOp::Less:
      return "<";
    case BinOp::Greater:
      return ">";
  }
  return "?";
}

std::string expr_to_string(const ExprPtr& e) {
  std::ostringstream out;
  write_expr(out, *e);
  return out.str();
}

std::string ast_to_string(const Block& block) {
  std::ostringstream out;
  for (std::size_t i = 0; i < block.stmts.size(); ++i) {
    out << (i == 0 ? "" : " ");
    write_stmt(out, *block.stmts[i]);
  }
  return out.str();
}

}  // namespace stackvm
