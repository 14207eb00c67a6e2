#include <gtest/gtest.h>

#include <iterator>
#include <string_view>
#include <vector>

#include "numcast/syntax/lexer.hpp"
#include "numcast/syntax/token.hpp"

using numcast::FileId;
using numcast::syntax::Lexer;
using numcast::syntax::Token;
using numcast::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src)
{
  Lexer lexer(FileId{0}, src);
  return lexer.lex_all();
}

}  // namespace

TEST(SyntaxLexer, EmitsLineAndBlockCommentsAsTokens)
{
  const std::string_view src =
    "// line\n"
    "/* block */\n"
    "var x = 1; // trailing\n"
    "var y = /* inline */ 2;\n";

  const auto toks = lex(src);

  int var_count = 0;
  int line_comment_count = 0;
  int block_comment_count = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Identifier && t.text == "var") {
      ++var_count;
    }
    if (t.kind == TokenKind::LineComment) {
      ++line_comment_count;
    }
    if (t.kind == TokenKind::BlockComment) {
      ++block_comment_count;
    }
  }
  EXPECT_EQ(var_count, 2);
  EXPECT_EQ(line_comment_count, 2);
  EXPECT_EQ(block_comment_count, 2);
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, BasePrefixedIntegerLiterals)
{
  for (const std::string_view lit : {"0x7F800000", "0XFF", "0b1010", "0o777"}) {
    const auto toks = lex(lit);
    ASSERT_EQ(toks.size(), 2U) << lit;
    EXPECT_EQ(toks[0].kind, TokenKind::IntLiteral) << lit;
    EXPECT_EQ(toks[0].text, lit);
  }
}

TEST(SyntaxLexer, InvalidBaseLiteralBecomesUnknown)
{
  const auto toks = lex("var x = 0o89;");

  bool saw_unknown = false;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Unknown && t.text.find("0o") == 0) {
      saw_unknown = true;
      break;
    }
  }
  EXPECT_TRUE(saw_unknown);
}

TEST(SyntaxLexer, FloatLiterals)
{
  for (const std::string_view lit : {"0.0", "2.5", "1e10", "3.4e+38", "1E-5"}) {
    const auto toks = lex(lit);
    ASSERT_EQ(toks.size(), 2U) << lit;
    EXPECT_EQ(toks[0].kind, TokenKind::FloatLiteral) << lit;
  }
}

TEST(SyntaxLexer, MalformedFloatReturnsTokens)
{
  // "1." has no fraction: Int(1) then Dot
  auto toks = lex("1.");
  ASSERT_EQ(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::IntLiteral);
  EXPECT_EQ(toks[1].kind, TokenKind::Dot);

  // ".5" must start with a digit: Dot then Int(5)
  toks = lex(".5");
  ASSERT_EQ(toks.size(), 3U);
  EXPECT_EQ(toks[0].kind, TokenKind::Dot);
  EXPECT_EQ(toks[1].kind, TokenKind::IntLiteral);
}

TEST(SyntaxLexer, OperatorsAndPunctuation)
{
  const auto toks = lex("( ) < > . , ; + - = == !=");
  const TokenKind expected[] = {
    TokenKind::LParen, TokenKind::RParen, TokenKind::Lt,        TokenKind::Gt,
    TokenKind::Dot,    TokenKind::Comma,  TokenKind::Semicolon, TokenKind::Plus,
    TokenKind::Minus,  TokenKind::Eq,     TokenKind::EqEq,      TokenKind::Ne,
    TokenKind::Eof,
  };
  ASSERT_EQ(toks.size(), std::size(expected));
  for (size_t i = 0; i < toks.size(); ++i) {
    EXPECT_EQ(toks[i].kind, expected[i]) << "token " << i;
  }
}

TEST(SyntaxLexer, CastAndTypeConstantTokens)
{
  const auto toks = lex("<f32>-f32.MAX_VALUE");
  ASSERT_EQ(toks.size(), 8U);
  EXPECT_EQ(toks[0].kind, TokenKind::Lt);
  EXPECT_EQ(toks[1].text, "f32");
  EXPECT_EQ(toks[2].kind, TokenKind::Gt);
  EXPECT_EQ(toks[3].kind, TokenKind::Minus);
  EXPECT_EQ(toks[4].text, "f32");
  EXPECT_EQ(toks[5].kind, TokenKind::Dot);
  EXPECT_EQ(toks[6].text, "MAX_VALUE");
}

TEST(SyntaxLexer, UnclosedBlockCommentBecomesUnknown)
{
  const auto toks = lex("/* unclosed comment");

  ASSERT_EQ(toks.size(), 2U);
  EXPECT_EQ(toks[0].kind, TokenKind::Unknown);
  EXPECT_EQ(toks[1].kind, TokenKind::Eof);
}

TEST(SyntaxLexer, InvalidCharReturnsUnknown)
{
  const auto toks = lex("var $ x");

  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[1].kind, TokenKind::Unknown);
  EXPECT_EQ(toks[1].text, "$");
  EXPECT_EQ(toks[2].text, "x");
}

TEST(SyntaxLexer, RangesAreByteOffsets)
{
  const auto toks = lex("var  f0");
  ASSERT_GE(toks.size(), 2U);
  EXPECT_EQ(toks[1].begin(), 5U);
  EXPECT_EQ(toks[1].end(), 7U);
  EXPECT_EQ(toks[1].range.file_id(), FileId{0});
}
