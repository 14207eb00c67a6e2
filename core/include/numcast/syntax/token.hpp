#pragma once

#include <cstdint>
#include <string_view>

#include "numcast/basic/source_manager.hpp"

namespace numcast::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  // Comments are kept so tools can see them; the parser never does.
  LineComment,   // // ...
  BlockComment,  // /* ... */

  Identifier,
  IntLiteral,
  FloatLiteral,

  LParen,
  RParen,
  Lt,
  Gt,
  Dot,
  Comma,
  Semicolon,

  Plus,
  Minus,

  Eq,
  EqEq,
  Ne,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;
  std::string_view text;

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }

  [[nodiscard]] bool is_trivia() const noexcept
  {
    return kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
  }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "int";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
  }
  return "";
}

}  // namespace numcast::syntax
