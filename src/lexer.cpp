#include "stackvm/lexer.hpp"

#include <cctype>
#include <cstdint>
#include <iomanip>
#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace stackvm {

namespace {

LexResult ok(Token tok) {
  LexResult out;
  out.status = LexResult::Status::Token;
  out.token = std::move(tok);
  return out;
}

LexResult fail(ErrCode code, const std::string& message) {
  LexResult out;
  out.status = LexResult::Status::Error;
  out.err = Err{code, message};
  return out;
}

bool is_ident_start(char c) {
  return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// Printable ASCII is quoted; anything else, including UTF-8 lead bytes, is
// shown as a hex byte.
std::string describe_byte(char c) {
  const unsigned char b = static_cast<unsigned char>(c);
  if (b < 0x80 && std::isprint(b)) {
    return "'" + std::string(1, c) + "'";
  }
  std::ostringstream os;
  os << "0x" << std::uppercase << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(b);
  return os.str();
}

}  // namespace

const char* token_kind_name(TokenKind kind) {
  switch (kind) {
    case TokenKind::Number:
      return "number";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Let:
      return "'let'";
    case TokenKind::If:
      return "'if'";
    case TokenKind::Else:
      return "'else'";
    case TokenKind::While:
      return "'while'";
    case TokenKind::Print:
      return "'print'";
    case TokenKind::Plus:
      return "'+'";
    case TokenKind::Minus:
      return "'-'";
    case TokenKind::Star:
      return "'*'";
    case TokenKind::Slash:
      return "'/'";
    case TokenKind::Assign:
      return "'='";
    case TokenKind::EqualEqual:
      return "'=='";
    case TokenKind::Less:
      return "'<'";
    case TokenKind::Greater:
      return "'>'";
    case TokenKind::LParen:
      return "'('";
    case TokenKind::RParen:
      return "')'";
    case TokenKind::Semicolon:
      return "';'";
  }
  return "token";
}

std::string describe_token(const Token& tok) {
  if (tok.kind == TokenKind::Number) {
    return "number " + std::to_string(tok.number);
  }
  if (tok.kind == TokenKind::Identifier) {
    return "identifier " + tok.text;
  }
  return token_kind_name(tok.kind);
}

Lexer::Lexer(std::string text) : text_(std::move(text)) {}

LexResult Lexer::next_token() {
  skip_ws();
  if (pos_ >= text_.size()) {
    return LexResult{};
  }

  const char c = text_[pos_];
  if (std::isdigit(static_cast<unsigned char>(c))) return read_number();
  if (is_ident_start(c)) return read_identifier();

  switch (c) {
    case '+':
      return single(TokenKind::Plus);
    case '-':
      return single(TokenKind::Minus);
    case '*':
      return single(TokenKind::Star);
    case '/':
      return single(TokenKind::Slash);
    case '(':
      return single(TokenKind::LParen);
    case ')':
      return single(TokenKind::RParen);
    case ';':
      return single(TokenKind::Semicolon);
    case '<':
      return single(TokenKind::Less);
    case '>':
      return single(TokenKind::Greater);
    case '=':
      pos_++;
      if (peek('=')) {
        pos_++;
        return ok(Token::make(TokenKind::EqualEqual));
      }
      return ok(Token::make(TokenKind::Assign));
    default:
      break;
  }

  return fail(ErrCode::Lex, "unexpected character " + describe_byte(c) + " at offset " +
                                std::to_string(pos_));
}

LexResult Lexer::read_number() {
  const std::size_t start = pos_;
  const std::uint64_t limit = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
  std::uint64_t value = 0;
  bool overflow = false;
  while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
    const std::uint64_t digit = static_cast<std::uint64_t>(text_[pos_] - '0');
    if (!overflow && value > (limit - digit) / 10) {
      overflow = true;
    }
    if (!overflow) {
      value = value * 10 + digit;
    }
    pos_++;
  }
  if (overflow) {
    return fail(ErrCode::IntOverflow, "integer literal " + text_.substr(start, pos_ - start) +
                                          " does not fit in 64 bits");
  }
  return ok(Token::make_number(static_cast<std::int64_t>(value)));
}

LexResult Lexer::read_identifier() {
  const std::size_t start = pos_;
  while (pos_ < text_.size() && is_ident_char(text_[pos_])) pos_++;
  std::string word = text_.substr(start, pos_ - start);

  if (word == "let") return ok(Token::make(TokenKind::Let));
  if (word == "if") return ok(Token::make(TokenKind::If));
  if (word == "else") return ok(Token::make(TokenKind::Else));
  if (word == "while") return ok(Token::make(TokenKind::While));
  if (word == "print") return ok(Token::make(TokenKind::Print));
  return ok(Token::make_identifier(std::move(word)));
}

LexResult Lexer::single(TokenKind kind) {
  pos_++;
  return ok(Token::make(kind));
}

bool Lexer::peek(char c) const { return pos_ < text_.size() && text_[pos_] == c; }

void Lexer::skip_ws() {
  while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) pos_++;
}

}  // namespace stackvm
