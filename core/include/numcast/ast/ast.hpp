// numcast/ast/ast.hpp - Conformance script AST
//
// Nodes are arena-allocated by AstContext and must stay trivially
// destructible. Dispatch is by NodeKind with isa/cast/dyn_cast.
//
#pragma once

#include <cassert>
#include <cstdint>
#include <gsl/span>
#include <optional>
#include <string_view>

#include "numcast/basic/source_manager.hpp"
#include "numcast/value/numeric_kind.hpp"

namespace numcast
{

// ============================================================================
// Node Kinds
// ============================================================================

enum class NodeKind : uint8_t {
  Program,

  // Statements
  VarDeclStmt,
  AssertStmt,

  // Expressions
  IntLiteral,
  FloatLiteral,
  BoolLiteral,
  VarRef,
  TypeConstant,
  UnaryExpr,
  BinaryExpr,
  CastExpr,
  ReinterpretExpr,
  MissingExpr,
};

[[nodiscard]] constexpr bool is_stmt_kind(NodeKind k) noexcept
{
  return k == NodeKind::VarDeclStmt || k == NodeKind::AssertStmt;
}

[[nodiscard]] constexpr bool is_expr_kind(NodeKind k) noexcept
{
  return k >= NodeKind::IntLiteral && k <= NodeKind::MissingExpr;
}

enum class UnaryOp : uint8_t {
  Plus,
  Neg,
};

enum class BinaryOp : uint8_t {
  Add,
  Sub,
  Eq,
  Ne,
};

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
  }
  return "";
}

// ============================================================================
// Scalar type names
// ============================================================================

/**
 * A type written in a cast or reinterpret: a numeric kind or `bool`.
 */
struct ScalarType
{
  std::optional<NumericKind> numeric;  ///< nullopt means bool
  SourceRange range;

  [[nodiscard]] bool is_bool() const noexcept { return !numeric.has_value(); }

  [[nodiscard]] std::string_view name() const noexcept
  {
    return numeric ? to_string(*numeric) : std::string_view("bool");
  }
};

// ============================================================================
// Base Classes
// ============================================================================

class AstNode
{
public:
  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind_; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  AstNode(NodeKind k, SourceRange r) : kind_(k), range_(r) {}
  ~AstNode() = default;

private:
  NodeKind kind_;
  SourceRange range_;
};

template <NodeKind K, typename Base>
class NodeBase : public Base
{
public:
  static constexpr NodeKind k_kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r) : Base(K, r) {}
};

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->get_kind()); }

protected:
  Expr(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->get_kind()); }

protected:
  Stmt(NodeKind k, SourceRange r) : AstNode(k, r) {}
};

// ============================================================================
// Casting
// ============================================================================

template <typename T>
[[nodiscard]] inline bool isa(const AstNode * node) noexcept
{
  return node != nullptr && T::classof(node);
}

template <typename T>
[[nodiscard]] inline const T * cast(const AstNode * node) noexcept
{
  assert(isa<T>(node) && "invalid AST cast");
  return static_cast<const T *>(node);
}

template <typename T>
[[nodiscard]] inline const T * dyn_cast(const AstNode * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

// ============================================================================
// Expressions
// ============================================================================

/// Integer literal; the value is the literal's magnitude (no sign)
class IntLiteralExpr : public NodeBase<NodeKind::IntLiteral, Expr>
{
public:
  uint64_t value;

  IntLiteralExpr(uint64_t v, SourceRange r) : NodeBase(r), value(v) {}
};

/// Float literal, including `NaN` and `Infinity`
class FloatLiteralExpr : public NodeBase<NodeKind::FloatLiteral, Expr>
{
public:
  double value;

  FloatLiteralExpr(double v, SourceRange r) : NodeBase(r), value(v) {}
};

class BoolLiteralExpr : public NodeBase<NodeKind::BoolLiteral, Expr>
{
public:
  bool value;

  BoolLiteralExpr(bool v, SourceRange r) : NodeBase(r), value(v) {}
};

class VarRefExpr : public NodeBase<NodeKind::VarRef, Expr>
{
public:
  std::string_view name;

  VarRefExpr(std::string_view n, SourceRange r) : NodeBase(r), name(n) {}
};

/// Type constant: `f32.MAX_VALUE`, `u8.MIN_VALUE`, ...
class TypeConstantExpr : public NodeBase<NodeKind::TypeConstant, Expr>
{
public:
  NumericKind type;
  std::string_view member;

  TypeConstantExpr(NumericKind t, std::string_view m, SourceRange r)
  : NodeBase(r), type(t), member(m)
  {
  }
};

class UnaryExpr : public NodeBase<NodeKind::UnaryExpr, Expr>
{
public:
  UnaryOp op;
  const Expr * operand;

  UnaryExpr(UnaryOp o, const Expr * e, SourceRange r) : NodeBase(r), op(o), operand(e) {}
};

class BinaryExpr : public NodeBase<NodeKind::BinaryExpr, Expr>
{
public:
  const Expr * lhs;
  BinaryOp op;
  const Expr * rhs;

  BinaryExpr(const Expr * left, BinaryOp o, const Expr * right, SourceRange r)
  : NodeBase(r), lhs(left), op(o), rhs(right)
  {
  }
};

/// Prefix cast: `<T>operand`
class CastExpr : public NodeBase<NodeKind::CastExpr, Expr>
{
public:
  ScalarType target;
  const Expr * operand;

  CastExpr(ScalarType t, const Expr * e, SourceRange r) : NodeBase(r), target(t), operand(e) {}
};

/// Bit reinterpretation: `reinterpret<T>(operand)`
class ReinterpretExpr : public NodeBase<NodeKind::ReinterpretExpr, Expr>
{
public:
  ScalarType target;
  const Expr * operand;

  ReinterpretExpr(ScalarType t, const Expr * e, SourceRange r)
  : NodeBase(r), target(t), operand(e)
  {
  }
};

/// Placeholder left by syntax error recovery
class MissingExpr : public NodeBase<NodeKind::MissingExpr, Expr>
{
public:
  explicit MissingExpr(SourceRange r) : NodeBase(r) {}
};

// ============================================================================
// Statements
// ============================================================================

/// `var name = init;`
class VarDeclStmt : public NodeBase<NodeKind::VarDeclStmt, Stmt>
{
public:
  std::string_view name;
  SourceRange name_range;
  const Expr * init;

  VarDeclStmt(std::string_view n, SourceRange nr, const Expr * i, SourceRange r)
  : NodeBase(r), name(n), name_range(nr), init(i)
  {
  }
};

/// `assert(condition);`
class AssertStmt : public NodeBase<NodeKind::AssertStmt, Stmt>
{
public:
  const Expr * condition;

  AssertStmt(const Expr * c, SourceRange r) : NodeBase(r), condition(c) {}
};

// ============================================================================
// Program
// ============================================================================

class Program : public NodeBase<NodeKind::Program, AstNode>
{
public:
  gsl::span<const Stmt *> stmts;

  explicit Program(SourceRange r) : NodeBase(r) {}
};

}  // namespace numcast
