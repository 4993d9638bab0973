// kleis/syntax/frontend.cpp - High-level parse pipeline
#include "kleis/syntax/frontend.hpp"

#include "kleis/syntax/lexer.hpp"
#include "kleis/syntax/parser.hpp"

namespace kleis
{

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = sources.register_file(path, std::move(source_text));
  const SourceFile * file = sources.get_file(out.file_id);

  syntax::Lexer lexer(out.file_id, file->content());
  syntax::Parser parser(out.file_id, *file, diags, lexer.lex_all());
  out.program = parser.parse_program();
  return out;
}

}  // namespace kleis
