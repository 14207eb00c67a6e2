#pragma once

#include <string_view>
#include <vector>

#include "numcast/ast/ast.hpp"
#include "numcast/ast/ast_context.hpp"
#include "numcast/basic/diagnostic.hpp"
#include "numcast/basic/source_manager.hpp"
#include "numcast/syntax/token.hpp"

namespace numcast::syntax
{

/**
 * Recursive-descent parser for conformance scripts.
 *
 * Syntax errors are reported to the DiagnosticBag and the parser resumes at
 * the next statement, so a single run reports every broken line.
 */
class Parser
{
public:
  /// @param tokens Token stream without trivia, ending with Eof
  Parser(AstContext & ast, FileId file_id, const SourceFile & source, DiagnosticBag & diags,
         std::vector<Token> tokens)
  : ast_(ast), file_id_(file_id), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Program * parse_program();

  /// Parse a single expression followed by Eof (used by `numcast eval`)
  [[nodiscard]] const Expr * parse_standalone_expr();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const { return cur().kind == k; }
  [[nodiscard]] bool at_eof() const { return at(TokenKind::Eof); }
  [[nodiscard]] bool at_kw(std::string_view kw) const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string_view msg, const char * code);
  void synchronize_to_stmt();

  // Statements
  [[nodiscard]] const Stmt * parse_stmt();
  [[nodiscard]] const Stmt * parse_var_stmt();
  [[nodiscard]] const Stmt * parse_assert_stmt();

  // Types
  [[nodiscard]] std::optional<ScalarType> parse_type_args();

  // Expressions
  [[nodiscard]] const Expr * parse_expr();
  [[nodiscard]] const Expr * parse_additive();
  [[nodiscard]] const Expr * parse_unary();
  [[nodiscard]] const Expr * parse_primary();
  [[nodiscard]] const Expr * parse_int_literal(const Token & t);
  [[nodiscard]] const Expr * parse_float_literal(const Token & t);
  [[nodiscard]] const Expr * parse_reinterpret();

  [[nodiscard]] const Expr * make_missing_expr_at(const Token & t);

  AstContext & ast_;
  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace numcast::syntax
