#pragma once

#include <string>
#include <vector>

#include "stackvm/ast.hpp"
#include "stackvm/errors.hpp"
#include "stackvm/lexer.hpp"

namespace stackvm {

// Upper bound on block nesting, parenthesis nesting and expression tree
// height. Deeper input is rejected with "nesting too deep".
constexpr int kMaxNestingDepth = 1000;

struct ParseResult {
  bool is_error = false;
  Block program;
  Err err{ErrCode::Parse, ""};
};

// Recursive-descent parser with one token of lookahead. The first lexical or
// structural error rejects the whole program.
class Parser {
 public:
  explicit Parser(std::string text);

  ParseResult parse_program();

 private:
  void advance();
  bool at_end() const;
  bool check(TokenKind kind) const;
  void expect(TokenKind kind);
  std::string current_description() const;
  [[noreturn]] void fail_expected(const std::string& expected) const;
  void enter_nested();
  void leave_nested();
  void check_depth(int depth) const;

  StmtPtr parse_statement();
  Block parse_block();
  ExprPtr parse_expression();
  ExprPtr parse_comparison();
  ExprPtr parse_additive();
  ExprPtr parse_multiplicative();
  ExprPtr parse_primary();

  Lexer lexer_;
  LexResult current_;
  int nesting_ = 0;
  // Height of the expression most recently returned by a parse_* call.
  int expr_depth_ = 0;
};

ParseResult parse_program(const std::string& text);

}  // namespace stackvm
