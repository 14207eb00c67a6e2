#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "numcast/syntax/token.hpp"

namespace numcast::syntax
{

class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src) : file_id_(file_id), src_(src) {}

  /// Lex the whole input; the last token is always Eof
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  void skip_whitespace();

  [[nodiscard]] Token lex_identifier();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_comment();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start) const noexcept
  {
    const auto b = static_cast<uint32_t>(start);
    const auto e = static_cast<uint32_t>(pos_);
    return {kind, SourceRange(file_id_, b, e), src_.substr(start, pos_ - start)};
  }

  FileId file_id_;
  std::string_view src_;
  size_t pos_ = 0;
};

}  // namespace numcast::syntax
