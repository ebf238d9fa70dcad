#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace stackvm {

enum class TokenKind {
  Number,
  Identifier,
  Let,
  If,
  Else,
  While,
  Print,
  Plus,
  Minus,
  Star,
  Slash,
  Assign,
  EqualEqual,
  Less,
  Greater,
  LParen,
  RParen,
  Semicolon,
};

struct Token {
  TokenKind kind = TokenKind::Semicolon;
  std::int64_t number = 0;
  std::string text;

  static Token make(TokenKind kind) {
    Token out;
    out.kind = kind;
    return out;
  }

  static Token make_number(std::int64_t v) {
    Token out;
    out.kind = TokenKind::Number;
    out.number = v;
    return out;
  }

  static Token make_identifier(std::string name) {
    Token out;
    out.kind = TokenKind::Identifier;
    out.text = std::move(name);
    return out;
  }
};

inline bool operator==(const Token& a, const Token& b) {
  if (a.kind != b.kind) {
    return false;
  }
  if (a.kind == TokenKind::Number) {
    return a.number == b.number;
  }
  if (a.kind == TokenKind::Identifier) {
    return a.text == b.text;
  }
  return true;
}

inline bool operator!=(const Token& a, const Token& b) { return !(a == b); }

const char* token_kind_name(TokenKind kind);

// Human readable form used in parse errors, e.g. `number 42`, `identifier x`, `'('`.
std::string describe_token(const Token& tok);

}  // namespace stackvm
