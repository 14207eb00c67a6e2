#include "numcast/syntax/lexer.hpp"

#include <cctype>

namespace numcast::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_'; }
bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_digit_in_base(unsigned char c, int base)
{
  switch (base) {
    case 2:
      return c == '0' || c == '1';
    case 8:
      return c >= '0' && c <= '7';
    default:
      return std::isxdigit(c) != 0;
  }
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.substr(pos_, s.size()) == s;
}

void Lexer::skip_whitespace()
{
  while (!eof()) {
    const char c = peek();
    if (c != ' ' && c != '\t' && c != '\n' && c != '\r') {
      break;
    }
    advance();
  }
}

Token Lexer::lex_comment()
{
  const size_t start = pos_;

  if (starts_with("//")) {
    while (!eof() && peek() != '\n') {
      advance();
    }
    return make_token(TokenKind::LineComment, start);
  }

  // Block comment; an unterminated one swallows the rest of the input and
  // is reported as Unknown.
  advance(2);
  while (!eof() && !starts_with("*/")) {
    advance();
  }
  if (eof()) {
    return make_token(TokenKind::Unknown, start);
  }
  advance(2);
  return make_token(TokenKind::BlockComment, start);
}

Token Lexer::lex_identifier()
{
  const size_t start = pos_;
  advance();
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance();
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const size_t start = pos_;

  // Base-prefixed integers: 0x.. 0b.. 0o..
  if (peek() == '0') {
    const char p1 = static_cast<char>(std::tolower(static_cast<unsigned char>(peek(1))));
    if (p1 == 'x' || p1 == 'b' || p1 == 'o') {
      const int base = (p1 == 'x') ? 16 : (p1 == 'b') ? 2 : 8;
      advance(2);

      bool any = false;
      bool invalid = false;
      while (!eof()) {
        const auto c = static_cast<unsigned char>(peek());
        if (is_digit_in_base(c, base)) {
          any = true;
        } else if (is_ident_continue(c)) {
          // Still looks like part of the literal: consume it, but reject.
          invalid = true;
        } else {
          break;
        }
        advance();
      }

      return make_token((any && !invalid) ? TokenKind::IntLiteral : TokenKind::Unknown, start);
    }
  }

  while (is_digit(peek())) {
    advance();
  }

  bool is_float = false;

  if (peek() == '.' && is_digit(peek(1))) {
    is_float = true;
    advance();
    while (is_digit(peek())) {
      advance();
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    const size_t sign = (peek(1) == '+' || peek(1) == '-') ? 1 : 0;
    if (is_digit(peek(1 + sign))) {
      is_float = true;
      advance(1 + sign);
      while (is_digit(peek())) {
        advance();
      }
    }
  }

  return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start);
}

Token Lexer::next_token()
{
  skip_whitespace();

  if (eof()) {
    return make_token(TokenKind::Eof, pos_);
  }

  if (starts_with("//") || starts_with("/*")) {
    return lex_comment();
  }

  const auto c = static_cast<unsigned char>(peek());
  if (is_ident_start(c)) {
    return lex_identifier();
  }
  if (is_digit(peek())) {
    return lex_number();
  }

  const size_t start = pos_;

  if (starts_with("==")) {
    advance(2);
    return make_token(TokenKind::EqEq, start);
  }
  if (starts_with("!=")) {
    advance(2);
    return make_token(TokenKind::Ne, start);
  }

  TokenKind kind = TokenKind::Unknown;
  switch (peek()) {
    case '(':
      kind = TokenKind::LParen;
      break;
    case ')':
      kind = TokenKind::RParen;
      break;
    case '<':
      kind = TokenKind::Lt;
      break;
    case '>':
      kind = TokenKind::Gt;
      break;
    case '.':
      kind = TokenKind::Dot;
      break;
    case ',':
      kind = TokenKind::Comma;
      break;
    case ';':
      kind = TokenKind::Semicolon;
      break;
    case '+':
      kind = TokenKind::Plus;
      break;
    case '-':
      kind = TokenKind::Minus;
      break;
    case '=':
      kind = TokenKind::Eq;
      break;
    default:
      break;
  }
  advance();
  return make_token(kind, start);
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    out.push_back(next_token());
    if (out.back().kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace numcast::syntax
