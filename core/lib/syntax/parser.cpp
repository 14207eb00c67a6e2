#include "numcast/syntax/parser.hpp"

#include <cerrno>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>

namespace numcast::syntax
{
namespace
{

SourceRange join_ranges(SourceRange a, SourceRange b)
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.get_begin(), b.get_end()};
}

[[nodiscard]] bool is_reserved_word(std::string_view ident) noexcept
{
  return ident == "var" || ident == "assert" || ident == "reinterpret" || ident == "true" ||
         ident == "false";
}

/// Names that always parse as literals or type names, never as variable references
[[nodiscard]] bool is_builtin_name(std::string_view ident) noexcept
{
  return ident == "NaN" || ident == "Infinity" || ident == "bool" ||
         lookup_numeric_kind(ident).has_value();
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

bool Parser::at_kw(std::string_view kw) const
{
  return at(TokenKind::Identifier) && cur().text == kw;
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }

  // A missing ';' at the end of a line is reported after the previous token.
  if (k == TokenKind::Semicolon && idx_ > 0) {
    const Token & prev = tokens_[idx_ - 1];
    const auto prev_lc = source_.get_line_column(prev.end());
    const auto curr_lc = source_.get_line_column(cur().begin());
    if (at_eof() || curr_lc.line > prev_lc.line) {
      diags_
        .report_error(prev.range, std::string("expected ") + std::string(what), "expected `;`")
        .with_code(diag_code::k_expected_token)
        .with_fixit(SourceRange(file_id_, prev.end(), prev.end()), ";");
      return false;
    }
  }

  error_at(cur(), std::string("expected ") + std::string(what), diag_code::k_expected_token);
  return false;
}

void Parser::error_at(const Token & t, std::string_view msg, const char * code)
{
  if (t.kind == TokenKind::Unknown) {
    // The lexer already could not make sense of it; say that instead.
    diags_.report_error(t.range, "unknown token `" + std::string(t.text) + "`")
      .with_code(diag_code::k_unknown_token);
    return;
  }
  diags_.report_error(t.range, std::string(msg)).with_code(code);
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at_kw("var") || at_kw("assert")) {
      return;
    }
    advance();
  }
}

// ============================================================================
// Entry points
// ============================================================================

Program * Parser::parse_program()
{
  const uint32_t end = static_cast<uint32_t>(source_.content().size());
  auto * program = ast_.create<Program>(SourceRange(file_id_, 0, end));

  std::vector<const Stmt *> stmts;
  while (!at_eof()) {
    const size_t before = idx_;
    if (const Stmt * s = parse_stmt()) {
      stmts.push_back(s);
    }
    if (idx_ == before) {
      // No progress: drop the offending token so the loop terminates.
      advance();
    }
  }

  program->stmts = ast_.copy_to_arena(stmts);
  return program;
}

const Expr * Parser::parse_standalone_expr()
{
  const Expr * e = parse_expr();
  if (!at_eof()) {
    error_at(cur(), "unexpected token after expression", diag_code::k_expected_token);
  }
  return e;
}

// ============================================================================
// Statements
// ============================================================================

const Stmt * Parser::parse_stmt()
{
  if (at_kw("var")) {
    return parse_var_stmt();
  }
  if (at_kw("assert")) {
    return parse_assert_stmt();
  }

  if (at(TokenKind::Unknown)) {
    error_at(cur(), "", diag_code::k_unknown_token);
  } else {
    diags_.report_error(cur().range, "expected `var` or `assert` statement")
      .with_code(diag_code::k_unexpected_statement)
      .with_help("a script is a sequence of `var name = expr;` and `assert(expr);` statements");
  }
  synchronize_to_stmt();
  return nullptr;
}

const Stmt * Parser::parse_var_stmt()
{
  const Token & kw = advance();  // var

  if (!at(TokenKind::Identifier) || is_reserved_word(cur().text)) {
    error_at(cur(), "expected variable name after `var`", diag_code::k_expected_token);
    synchronize_to_stmt();
    return nullptr;
  }
  if (is_builtin_name(cur().text)) {
    diags_
      .report_error(
        cur().range, "`" + std::string(cur().text) + "` cannot be used as a variable name",
        "builtin name")
      .with_code(diag_code::k_expected_token);
    synchronize_to_stmt();
    return nullptr;
  }
  const Token & name = advance();

  if (!expect(TokenKind::Eq, "`=` in variable declaration")) {
    synchronize_to_stmt();
    return nullptr;
  }

  const Expr * init = parse_expr();
  const SourceRange range = join_ranges(kw.range, init->get_range());

  if (!expect(TokenKind::Semicolon, "`;` after variable declaration")) {
    synchronize_to_stmt();
  }

  return ast_.create<VarDeclStmt>(ast_.intern(name.text), name.range, init, range);
}

const Stmt * Parser::parse_assert_stmt()
{
  const Token & kw = advance();  // assert

  if (!expect(TokenKind::LParen, "`(` after `assert`")) {
    synchronize_to_stmt();
    return nullptr;
  }

  const Expr * cond = parse_expr();

  SourceRange range = join_ranges(kw.range, cond->get_range());
  if (at(TokenKind::RParen)) {
    range = join_ranges(range, cur().range);
  }
  if (!expect(TokenKind::RParen, "`)` to close `assert`")) {
    synchronize_to_stmt();
    return ast_.create<AssertStmt>(cond, range);
  }

  if (!expect(TokenKind::Semicolon, "`;` after `assert(...)`")) {
    synchronize_to_stmt();
  }

  return ast_.create<AssertStmt>(cond, range);
}

// ============================================================================
// Types
// ============================================================================

std::optional<ScalarType> Parser::parse_type_args()
{
  const Token & open = cur();
  if (!expect(TokenKind::Lt, "`<` before type name")) {
    return std::nullopt;
  }

  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected type name", diag_code::k_expected_token);
    return std::nullopt;
  }
  const Token & name = advance();

  ScalarType type;
  if (name.text != "bool") {
    type.numeric = lookup_numeric_kind(name.text);
    if (!type.numeric) {
      diags_.report_error(name.range, "unknown type `" + std::string(name.text) + "`")
        .with_code(diag_code::k_unknown_type)
        .with_help("expected one of i32, i64, u8, u32, u64, f32, f64, bool");
      match(TokenKind::Gt);
      return std::nullopt;
    }
  }

  const Token & close = cur();
  if (!expect(TokenKind::Gt, "`>` after type name")) {
    return std::nullopt;
  }
  type.range = join_ranges(open.range, close.range);
  return type;
}

// ============================================================================
// Expressions
// ============================================================================

const Expr * Parser::parse_expr()
{
  const Expr * lhs = parse_additive();

  if (!at(TokenKind::EqEq) && !at(TokenKind::Ne)) {
    return lhs;
  }
  const BinaryOp op = at(TokenKind::EqEq) ? BinaryOp::Eq : BinaryOp::Ne;
  advance();

  const Expr * rhs = parse_additive();
  const Expr * result =
    ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));

  if (at(TokenKind::EqEq) || at(TokenKind::Ne)) {
    diags_.report_error(cur().range, "comparison operators cannot be chained")
      .with_code(diag_code::k_chained_equality)
      .with_help("split the comparison into separate assertions");
    while (at(TokenKind::EqEq) || at(TokenKind::Ne)) {
      advance();
      (void)parse_additive();
    }
  }
  return result;
}

const Expr * Parser::parse_additive()
{
  const Expr * lhs = parse_unary();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = at(TokenKind::Plus) ? BinaryOp::Add : BinaryOp::Sub;
    advance();
    const Expr * rhs = parse_unary();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

const Expr * Parser::parse_unary()
{
  if (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const Token & op_tok = advance();
    const UnaryOp op = (op_tok.kind == TokenKind::Plus) ? UnaryOp::Plus : UnaryOp::Neg;
    const Expr * operand = parse_unary();
    return ast_.create<UnaryExpr>(op, operand, join_ranges(op_tok.range, operand->get_range()));
  }

  if (at(TokenKind::Lt)) {
    const Token & open = cur();
    const auto type = parse_type_args();
    const Expr * operand = parse_unary();
    if (!type) {
      return make_missing_expr_at(open);
    }
    return ast_.create<CastExpr>(*type, operand, join_ranges(open.range, operand->get_range()));
  }

  return parse_primary();
}

const Expr * Parser::parse_primary()
{
  const Token & t = cur();

  switch (t.kind) {
    case TokenKind::IntLiteral:
      advance();
      return parse_int_literal(t);
    case TokenKind::FloatLiteral:
      advance();
      return parse_float_literal(t);
    case TokenKind::LParen: {
      advance();
      const Expr * inner = parse_expr();
      expect(TokenKind::RParen, "`)`");
      return inner;
    }
    case TokenKind::Identifier:
      break;
    case TokenKind::Unknown:
      advance();
      error_at(t, "", diag_code::k_unknown_token);
      return make_missing_expr_at(t);
    default:
      error_at(t, "expected expression", diag_code::k_expected_expression);
      return make_missing_expr_at(t);
  }

  if (t.text == "true" || t.text == "false") {
    advance();
    return ast_.create<BoolLiteralExpr>(t.text == "true", t.range);
  }
  if (t.text == "NaN") {
    advance();
    return ast_.create<FloatLiteralExpr>(std::numeric_limits<double>::quiet_NaN(), t.range);
  }
  if (t.text == "Infinity") {
    advance();
    return ast_.create<FloatLiteralExpr>(std::numeric_limits<double>::infinity(), t.range);
  }
  if (t.text == "reinterpret") {
    return parse_reinterpret();
  }

  if (const auto kind = lookup_numeric_kind(t.text)) {
    advance();
    if (!expect(TokenKind::Dot, "`.` after type name")) {
      return make_missing_expr_at(t);
    }
    if (!at(TokenKind::Identifier)) {
      error_at(cur(), "expected constant name", diag_code::k_expected_token);
      return make_missing_expr_at(t);
    }
    const Token & member = advance();
    return ast_.create<TypeConstantExpr>(
      *kind, ast_.intern(member.text), join_ranges(t.range, member.range));
  }

  if (is_reserved_word(t.text)) {
    error_at(t, "expected expression", diag_code::k_expected_expression);
    return make_missing_expr_at(t);
  }

  advance();
  return ast_.create<VarRefExpr>(ast_.intern(t.text), t.range);
}

const Expr * Parser::parse_int_literal(const Token & t)
{
  std::string_view digits = t.text;
  int base = 10;
  if (digits.size() > 2 && digits[0] == '0') {
    const char p = digits[1];
    if (p == 'x' || p == 'X') {
      base = 16;
    } else if (p == 'b' || p == 'B') {
      base = 2;
    } else if (p == 'o' || p == 'O') {
      base = 8;
    }
    if (base != 10) {
      digits.remove_prefix(2);
    }
  }

  uint64_t value = 0;
  const auto * first = digits.data();
  const auto * last = digits.data() + digits.size();
  const auto res = std::from_chars(first, last, value, base);
  if (res.ec != std::errc{} || res.ptr != last) {
    diags_.report_error(t.range, "integer literal out of range", "does not fit in 64 bits")
      .with_code(diag_code::k_invalid_literal);
    return ast_.create<MissingExpr>(t.range);
  }
  return ast_.create<IntLiteralExpr>(value, t.range);
}

const Expr * Parser::parse_float_literal(const Token & t)
{
  const std::string text(t.text);
  errno = 0;
  char * end = nullptr;
  const double value = std::strtod(text.c_str(), &end);
  if (end != text.c_str() + text.size()) {
    diags_.report_error(t.range, "invalid float literal").with_code(diag_code::k_invalid_literal);
    return ast_.create<MissingExpr>(t.range);
  }
  // ERANGE on underflow still yields the nearest representable value.
  return ast_.create<FloatLiteralExpr>(value, t.range);
}

const Expr * Parser::parse_reinterpret()
{
  const Token & kw = advance();  // reinterpret

  const auto type = parse_type_args();

  if (!expect(TokenKind::LParen, "`(` after `reinterpret<T>`")) {
    return make_missing_expr_at(kw);
  }
  const Expr * operand = parse_expr();
  SourceRange range = join_ranges(kw.range, operand->get_range());
  if (at(TokenKind::RParen)) {
    range = join_ranges(range, cur().range);
  }
  expect(TokenKind::RParen, "`)` to close `reinterpret`");

  if (!type) {
    return ast_.create<MissingExpr>(range);
  }
  return ast_.create<ReinterpretExpr>(*type, operand, range);
}

const Expr * Parser::make_missing_expr_at(const Token & t)
{
  return ast_.create<MissingExpr>(t.range);
}

}  // namespace numcast::syntax
