#pragma once

#include <cstddef>
#include <string>

#include "stackvm/errors.hpp"
#include "stackvm/token.hpp"

namespace stackvm {

struct LexResult {
  enum class Status { Token, End, Error };
  Status status = Status::End;
  Token token;
  Err err{ErrCode::Lex, ""};
};

// Produces tokens on demand from a source string. A lexer cannot be rewound;
// construct a new one to tokenize the same text again.
class Lexer {
 public:
  explicit Lexer(std::string text);

  LexResult next_token();

 private:
  LexResult read_number();
  LexResult read_identifier();
  LexResult single(TokenKind kind);

  bool peek(char c) const;
  void skip_ws();

  std::string text_;
  std::size_t pos_ = 0;
};

}  // namespace stackvm
