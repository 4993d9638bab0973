// kleis/syntax/parser.hpp - Recursive-descent parser for .kleis structure sources
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "kleis/basic/diagnostic.hpp"
#include "kleis/basic/source_manager.hpp"
#include "kleis/structure/structure_def.hpp"
#include "kleis/syntax/token.hpp"

namespace kleis::syntax
{

class Parser
{
public:
  Parser(FileId file_id, const SourceFile & source, DiagnosticBag & diags, std::vector<Token> tokens)
  : file_id_(file_id), source_(source), diags_(diags), tokens_(std::move(tokens))
  {
  }

  /**
   * Parse every top-level declaration. Syntax errors are reported to the
   * diagnostic bag; the parser skips to the next declaration and continues,
   * so the program holds every declaration that parsed cleanly.
   */
  [[nodiscard]] StructureProgram parse_program();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw) const;
  [[nodiscard]] bool at_member_start() const;
  [[nodiscard]] bool at_toplevel_start() const;

  const Token & advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);

  void error_at(const Token & t, std::string_view msg, std::string_view label = "");

  // Recovery
  void synchronize_to_toplevel();
  /// Skip to the next member keyword or closing brace at the current nesting level.
  SourceRange skip_member_body();

  // Declarations
  [[nodiscard]] std::optional<StructureDef> parse_structure();
  [[nodiscard]] std::optional<ImplementsDef> parse_implements();
  [[nodiscard]] std::optional<OperationSignature> parse_operation_signature(bool is_element);
  [[nodiscard]] std::optional<DataDef> parse_data();
  [[nodiscard]] std::optional<TypeParam> parse_type_param();
  [[nodiscard]] std::optional<std::string> parse_operation_name();

  /// `{ member* }` of a structure or nested structure
  bool parse_members(
    std::vector<OperationSignature> & operations, std::vector<AxiomDecl> & axioms,
    std::vector<NestedStructure> & nested, std::vector<std::string> * definitions);
  [[nodiscard]] std::optional<NestedStructure> parse_nested_structure();
  [[nodiscard]] std::optional<AxiomDecl> parse_axiom();
  bool parse_implements_members(ImplementsDef & impl);

  // Types
  [[nodiscard]] std::optional<TypeExpr> parse_type();
  [[nodiscard]] std::optional<TypeExpr> parse_product();
  [[nodiscard]] std::optional<TypeExpr> parse_type_atom();

  [[nodiscard]] SourceRange range_from(const Token & first) const;

  FileId file_id_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

}  // namespace kleis::syntax
