#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace stackvm {

enum class BinOp {
  Add,
  Sub,
  Mul,
  Div,
  Equals,
  Less,
  Greater,
};

const char* bin_op_symbol(BinOp op);

struct Expr;
struct Stmt;

using ExprPtr = std::shared_ptr<Expr>;
using StmtPtr = std::shared_ptr<Stmt>;

struct Block {
  std::vector<StmtPtr> stmts;
};

struct Expr {
  enum class Kind {
    Number,
    Var,
    Binary,
  };

  explicit Expr(Kind kind) : kind(kind) {}
  virtual ~Expr() = default;

  Kind kind;
};

struct Stmt {
  enum class Kind {
    Let,
    Assign,
    If,
    While,
    Print,
  };

  explicit Stmt(Kind kind) : kind(kind) {}
  virtual ~Stmt() = default;

  Kind kind;
};

struct NumberExpr final : Expr {
  explicit NumberExpr(std::int64_t value) : Expr(Kind::Number), value(value) {}
  std::int64_t value;
};

struct VarExpr final : Expr {
  explicit VarExpr(std::string name) : Expr(Kind::Var), name(std::move(name)) {}
  std::string name;
};

struct BinaryExpr final : Expr {
  BinaryExpr(BinOp op, ExprPtr a, ExprPtr b) : Expr(Kind::Binary), op(op), a(std::move(a)), b(std::move(b)) {}
  BinOp op;
  ExprPtr a;
  ExprPtr b;
};

struct LetStmt final : Stmt {
  LetStmt(std::string name, ExprPtr e) : Stmt(Kind::Let), name(std::move(name)), e(std::move(e)) {}
  std::string name;
  ExprPtr e;
};

struct AssignStmt final : Stmt {
  AssignStmt(std::string name, ExprPtr e) : Stmt(Kind::Assign), name(std::move(name)), e(std::move(e)) {}
  std::string name;
  ExprPtr e;
};

struct IfStmt final : Stmt {
  IfStmt(ExprPtr cond, Block then_block, Block else_block)
      : Stmt(Kind::If), cond(std::move(cond)), then_block(std::move(then_block)), else_block(std::move(else_block)) {}
  ExprPtr cond;
  Block then_block;
  Block else_block;
};

struct WhileStmt final : Stmt {
  WhileStmt(ExprPtr cond, Block body) : Stmt(Kind::While), cond(std::move(cond)), body(std::move(body)) {}
  ExprPtr cond;
  Block body;
};

struct PrintStmt final : Stmt {
  explicit PrintStmt(ExprPtr e) : Stmt(Kind::Print), e(std::move(e)) {}
  ExprPtr e;
};

// Canonical source form: every binary expression is parenthesized and every
// block is written as `( ... )`. The result parses back to an equal tree.
std::string ast_to_string(const Block& block);
std::string expr_to_string(const ExprPtr& e);

}  // namespace stackvm
