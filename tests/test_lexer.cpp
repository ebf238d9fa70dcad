#include <iostream>
#include <string>
#include <vector>

#include "stackvm/errors.hpp"
#include "stackvm/lexer.hpp"
#include "stackvm/token.hpp"

namespace {

using stackvm::ErrCode;
using stackvm::LexResult;
using stackvm::Lexer;
using stackvm::Token;
using stackvm::TokenKind;

bool check(bool cond, const std::string& msg) {
  if (!cond) {
    std::cerr << "FAIL: " << msg << "\n";
    return false;
  }
  return true;
}

// Collects tokens until end of input or the first error; returns the final result.
LexResult lex_all(const std::string& text, std::vector<Token>& out) {
  Lexer lexer(text);
  while (true) {
    LexResult r = lexer.next_token();
    if (r.status != LexResult::Status::Token) {
      return r;
    }
    out.push_back(r.token);
  }
}

bool test_statement_tokens() {
  std::vector<Token> toks;
  const LexResult end = lex_all("let x = 10;\nprint x + y_2 * 3;", toks);
  if (!check(end.status == LexResult::Status::End, "lexing should reach end")) return false;
  const std::vector<Token> want = {
      Token::make(TokenKind::Let),           Token::make_identifier("x"), Token::make(TokenKind::Assign),
      Token::make_number(10),                Token::make(TokenKind::Semicolon),
      Token::make(TokenKind::Print),         Token::make_identifier("x"), Token::make(TokenKind::Plus),
      Token::make_identifier("y_2"),         Token::make(TokenKind::Star), Token::make_number(3),
      Token::make(TokenKind::Semicolon),
  };
  return check(toks == want, "token sequence mismatch");
}

bool test_keywords_and_identifiers() {
  std::vector<Token> toks;
  lex_all("if else while print let iffy _let Let", toks);
  if (!check(toks.size() == 8, "expected 8 tokens")) return false;
  if (!check(toks[0].kind == TokenKind::If, "if keyword")) return false;
  if (!check(toks[1].kind == TokenKind::Else, "else keyword")) return false;
  if (!check(toks[2].kind == TokenKind::While, "while keyword")) return false;
  if (!check(toks[3].kind == TokenKind::Print, "print keyword")) return false;
  if (!check(toks[4].kind == TokenKind::Let, "let keyword")) return false;
  if (!check(toks[5] == Token::make_identifier("iffy"), "keyword prefix is an identifier")) return false;
  if (!check(toks[6] == Token::make_identifier("_let"), "underscore identifier")) return false;
  return check(toks[7] == Token::make_identifier("Let"), "keywords are case sensitive");
}

bool test_equals_forms() {
  std::vector<Token> toks;
  lex_all("a == b = c===d", toks);
  const std::vector<Token> want = {
      Token::make_identifier("a"), Token::make(TokenKind::EqualEqual), Token::make_identifier("b"),
      Token::make(TokenKind::Assign), Token::make_identifier("c"), Token::make(TokenKind::EqualEqual),
      Token::make(TokenKind::Assign), Token::make_identifier("d"),
  };
  return check(toks == want, "== / = split");
}

bool test_digits_then_letters() {
  std::vector<Token> toks;
  lex_all("12ab", toks);
  if (!check(toks.size() == 2, "number then identifier")) return false;
  if (!check(toks[0] == Token::make_number(12), "number part")) return false;
  return check(toks[1] == Token::make_identifier("ab"), "identifier part");
}

bool test_unknown_character_is_error() {
  std::vector<Token> toks;
  const LexResult r = lex_all("let x = 1; $", toks);
  if (!check(r.status == LexResult::Status::Error, "unknown character must not look like end")) return false;
  if (!check(r.err.code == ErrCode::Lex, "lex error code")) return false;
  if (!check(r.err.message.find("offset 11") != std::string::npos, "error names the offset")) return false;
  return check(toks.size() == 5, "tokens before the bad character are produced");
}

bool test_non_ascii_byte_is_shown_as_hex() {
  std::vector<Token> toks;
  LexResult r = lex_all("print \xC3\xA9;", toks);
  if (!check(r.status == LexResult::Status::Error, "UTF-8 lead byte is a lexical error")) return false;
  if (!check(r.err.message == "unexpected character 0xC3 at offset 6", "lead byte printed as hex: " + r.err.message)) {
    return false;
  }
  r = lex_all("x\x01", toks);
  if (!check(r.err.message == "unexpected character 0x01 at offset 1", "control byte printed as hex: " + r.err.message)) {
    return false;
  }
  r = lex_all("let x = 1; $", toks);
  return check(r.err.message == "unexpected character '$' at offset 11", "printable byte is quoted: " + r.err.message);
}

bool test_integer_limits() {
  std::vector<Token> toks;
  LexResult r = lex_all("9223372036854775807", toks);
  if (!check(r.status == LexResult::Status::End, "INT64_MAX lexes")) return false;
  if (!check(toks.size() == 1 && toks[0].number == 9223372036854775807LL, "INT64_MAX value")) return false;

  toks.clear();
  r = lex_all("9223372036854775808", toks);
  if (!check(r.status == LexResult::Status::Error, "INT64_MAX + 1 fails")) return false;
  if (!check(r.err.code == ErrCode::IntOverflow, "overflow error code")) return false;

  toks.clear();
  r = lex_all("000000000000000000000042", toks);
  return check(r.status == LexResult::Status::End && toks.size() == 1 && toks[0].number == 42,
               "leading zeros do not overflow");
}

bool test_empty_and_whitespace() {
  std::vector<Token> toks;
  LexResult r = lex_all("", toks);
  if (!check(r.status == LexResult::Status::End && toks.empty(), "empty input")) return false;
  r = lex_all(" \t\r\n  ", toks);
  return check(r.status == LexResult::Status::End && toks.empty(), "whitespace only");
}

bool test_end_is_sticky() {
  Lexer lexer("x");
  if (!check(lexer.next_token().status == LexResult::Status::Token, "first token")) return false;
  if (!check(lexer.next_token().status == LexResult::Status::End, "then end")) return false;
  return check(lexer.next_token().status == LexResult::Status::End, "end repeats");
}

}  // namespace

int main() {
  if (!test_statement_tokens()) return 1;
  if (!test_keywords_and_identifiers()) return 1;
  if (!test_equals_forms()) return 1;
  if (!test_digits_then_letters()) return 1;
  if (!test_unknown_character_is_error()) return 1;
  if (!test_non_ascii_byte_is_shown_as_hex()) return 1;
  if (!test_integer_limits()) return 1;
  if (!test_empty_and_whitespace()) return 1;
  if (!test_end_is_sticky()) return 1;
  std::cout << "stackvm_test_lexer: OK\n";
  return 0;
}
