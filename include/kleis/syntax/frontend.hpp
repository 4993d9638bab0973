// kleis/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "kleis/basic/diagnostic.hpp"
#include "kleis/basic/source_manager.hpp"
#include "kleis/structure/structure_def.hpp"

namespace kleis
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  StructureProgram program;
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (declarations) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  DiagnosticBag & diags);

}  // namespace kleis
