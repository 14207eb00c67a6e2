// numcast/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "numcast/ast/ast.hpp"
#include "numcast/ast/ast_context.hpp"
#include "numcast/basic/diagnostic.hpp"
#include "numcast/basic/source_manager.hpp"

namespace numcast
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Program * program = nullptr;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

/**
 * Parse a single expression, e.g. the argument of `numcast eval`.
 *
 * The text is registered under `name`. Returns nullptr only if `sources`
 * could not register it.
 */
[[nodiscard]] const Expr * parse_expression(
  SourceRegistry & sources, std::string_view name, std::string source_text, AstContext & ast,
  DiagnosticBag & diags);

}  // namespace numcast
