// numcast/syntax/frontend.cpp - High-level parse pipeline
#include "numcast/syntax/frontend.hpp"

#include <vector>

#include "numcast/syntax/lexer.hpp"
#include "numcast/syntax/parser.hpp"

namespace numcast
{

namespace
{

std::vector<syntax::Token> lex_without_trivia(FileId file_id, std::string_view text)
{
  syntax::Lexer lexer(file_id, text);
  std::vector<syntax::Token> tokens = lexer.lex_all();

  std::vector<syntax::Token> filtered;
  filtered.reserve(tokens.size());
  for (const auto & t : tokens) {
    if (!t.is_trivia()) {
      filtered.push_back(t);
    }
  }
  return filtered;
}

}  // namespace

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, std::move(source_text));
  const SourceFile * file = sources.get_file(out.file_id);
  if (file == nullptr) {
    diags.report_error({}, "too many scripts loaded; cannot register " + path.string());
    out.program = ast.create<Program>(SourceRange{});
    return out;
  }

  syntax::Parser parser(
    ast, out.file_id, *file, diags, lex_without_trivia(out.file_id, file->content()));
  out.program = parser.parse_program();
  return out;
}

const Expr * parse_expression(
  SourceRegistry & sources, std::string_view name, std::string source_text, AstContext & ast,
  DiagnosticBag & diags)
{
  const FileId file_id = sources.register_file(std::string(name), std::move(source_text));
  const SourceFile * file = sources.get_file(file_id);
  if (file == nullptr) {
    return nullptr;
  }

  syntax::Parser parser(ast, file_id, *file, diags, lex_without_trivia(file_id, file->content()));
  return parser.parse_standalone_expr();
}

}  // namespace numcast
