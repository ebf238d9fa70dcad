#include "stackvm/parser.hpp"

#include <algorithm>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>

namespace stackvm {

namespace {

struct ParseFailure : std::runtime_error {
  explicit ParseFailure(Err e) : std::runtime_error(e.message), err(std::move(e)) {}
  Err err;
};

}  // namespace

Parser::Parser(std::string text) : lexer_(std::move(text)) { current_ = lexer_.next_token(); }

void Parser::advance() {
  current_ = lexer_.next_token();
  if (current_.status == LexResult::Status::Error) {
    throw ParseFailure(current_.err);
  }
}

bool Parser::at_end() const { return current_.status == LexResult::Status::End; }

bool Parser::check(TokenKind kind) const {
  return current_.status == LexResult::Status::Token && current_.token.kind == kind;
}

std::string Parser::current_description() const {
  if (at_end()) {
    return "end of input";
  }
  return describe_token(current_.token);
}

void Parser::fail_expected(const std::string& expected) const {
  throw ParseFailure(Err{ErrCode::Parse, "expected " + expected + ", got " + current_description()});
}

void Parser::check_depth(int depth) const {
  if (depth > kMaxNestingDepth) {
    throw ParseFailure(Err{ErrCode::Parse, "nesting too deep"});
  }
}

void Parser::enter_nested() { check_depth(++nesting_); }

void Parser::leave_nested() { --nesting_; }

void Parser::expect(TokenKind kind) {
  if (!check(kind)) {
    fail_expected(token_kind_name(kind));
  }
  advance();
}

ParseResult Parser::parse_program() {
  ParseResult out;
  try {
    if (current_.status == LexResult::Status::Error) {
      throw ParseFailure(current_.err);
    }
    while (!at_end()) {
      out.program.stmts.push_back(parse_statement());
    }
  } catch (const ParseFailure& e) {
    out.is_error = true;
    out.program.stmts.clear();
    out.err = e.err;
  }
  return out;
}

StmtPtr Parser::parse_statement() {
  if (check(TokenKind::Let)) {
    advance();
    if (!check(TokenKind::Identifier)) {
      fail_expected("identifier after 'let'");
    }
    std::string name = current_.token.text;
    advance();
    expect(TokenKind::Assign);
    ExprPtr e = parse_expression();
    expect(TokenKind::Semicolon);
    return std::make_shared<LetStmt>(std::move(name), std::move(e));
  }

  if (check(TokenKind::If)) {
    advance();
    ExprPtr cond = parse_expression();
    Block then_block = parse_block();
    Block else_block;
    if (check(TokenKind::Else)) {
      advance();
      else_block = parse_block();
    }
    return std::make_shared<IfStmt>(std::move(cond), std::move(then_block), std::move(else_block));
  }

  if (check(TokenKind::While)) {
    advance();
    ExprPtr cond = parse_expression();
    Block body = parse_block();
    return std::make_shared<WhileStmt>(std::move(cond), std::move(body));
  }

  if (check(TokenKind::Print)) {
    advance();
    ExprPtr e = parse_expression();
    expect(TokenKind::Semicolon);
    return std::make_shared<PrintStmt>(std::move(e));
  }

  if (check(TokenKind::Identifier)) {
    std::string name = current_.token.text;
    advance();
    expect(TokenKind::Assign);
    ExprPtr e = parse_expression();
    expect(TokenKind::Semicolon);
    return std::make_shared<AssignStmt>(std::move(name), std::move(e));
  }

  fail_expected("statement");
}

Block Parser::parse_block() {
  Block out;
  enter_nested();
  if (!check(TokenKind::LParen)) {
    out.stmts.push_back(parse_statement());
    leave_nested();
    return out;
  }
  advance();
  while (!at_end() && !check(TokenKind::RParen)) {
    out.stmts.push_back(parse_statement());
  }
  expect(TokenKind::RParen);
  leave_nested();
  return out;
}

ExprPtr Parser::parse_expression() { return parse_comparison(); }

ExprPtr Parser::parse_comparison() {
  ExprPtr e = parse_additive();
  int depth = expr_depth_;
  while (true) {
    BinOp op = BinOp::Add;
    if (check(TokenKind::EqualEqual)) op = BinOp::Equals;
    else if (check(TokenKind::Less)) op = BinOp::Less;
    else if (check(TokenKind::Greater)) op = BinOp::Greater;
    else break;
    advance();
    ExprPtr rhs = parse_additive();
    depth = std::max(depth, expr_depth_) + 1;
    check_depth(depth);
    e = std::make_shared<BinaryExpr>(op, std::move(e), std::move(rhs));
  }
  expr_depth_ = depth;
  return e;
}

ExprPtr Parser::parse_additive() {
  ExprPtr e = parse_multiplicative();
  int depth = expr_depth_;
  while (true) {
    BinOp op = BinOp::Add;
    if (check(TokenKind::Plus)) op = BinOp::Add;
    else if (check(TokenKind::Minus)) op = BinOp::Sub;
    else break;
    advance();
    ExprPtr rhs = parse_multiplicative();
    depth = std::max(depth, expr_depth_) + 1;
    check_depth(depth);
    e = std::make_shared<BinaryExpr>(op, std::move(e), std::move(rhs));
  }
  expr_depth_ = depth;
  return e;
}

ExprPtr Parser::parse_multiplicative() {
  ExprPtr e = parse_primary();
  int depth = expr_depth_;
  while (true) {
    BinOp op = BinOp::Add;
    if (check(TokenKind::Star)) op = BinOp::Mul;
    else if (check(TokenKind::Slash)) op = BinOp::Div;
    else break;
    advance();
    ExprPtr rhs = parse_primary();
    depth = std::max(depth, expr_depth_) + 1;
    check_depth(depth);
    e = std::make_shared<BinaryExpr>(op, std::move(e), std::move(rhs));
  }
  expr_depth_ = depth;
  return e;
}

ExprPtr Parser::parse_primary() {
  if (check(TokenKind::Number)) {
    const std::int64_t v = current_.token.number;
    advance();
    expr_depth_ = 1;
    return std::make_shared<NumberExpr>(v);
  }
  if (check(TokenKind::Identifier)) {
    std::string name = current_.token.text;
    advance();
    expr_depth_ = 1;
    return std::make_shared<VarExpr>(std::move(name));
  }
  if (check(TokenKind::LParen)) {
    advance();
    enter_nested();
    ExprPtr e = parse_expression();
    expect(TokenKind::RParen);
    leave_nested();
    return e;
  }
  fail_expected("expression");
}

ParseResult parse_program(const std::string& text) {
  Parser parser(text);
  return parser.parse_program();
}

}  // namespace stackvm
