// kleis/structure/structure_def.cpp
#include "kleis/structure/structure_def.hpp"

#include <algorithm>
#include <iterator>

namespace kleis
{

namespace
{

void split_curried(const TypeExpr & type, std::vector<TypeExpr> & params, TypeExpr & result)
{
  const TypeExpr * cursor = &type;
  while (cursor->kind == TypeExprKind::Function) {
    const TypeExpr & domain = cursor->domain();
    if (domain.kind == TypeExprKind::Product) {
      params.insert(params.end(), domain.args.begin(), domain.args.end());
    } else {
      params.push_back(domain);
    }
    cursor = &cursor->codomain();
  }
  result = *cursor;
}

void collect_nested(
  const std::vector<NestedStructure> & nested, std::vector<const OperationSignature *> & out)
{
  for (const auto & n : nested) {
    for (const auto & op : n.operations) {
      out.push_back(&op);
    }
    collect_nested(n.nested, out);
  }
}

}  // namespace

OperationSignature OperationSignature::from_type(std::string name, TypeExpr type, SourceRange range)
{
  OperationSignature sig;
  sig.name = std::move(name);
  split_curried(type, sig.params, sig.result);
  sig.type = std::move(type);
  sig.range = range;
  return sig;
}

// ============================================================================
// StructureDef
// ============================================================================

std::vector<const OperationSignature *> StructureDef::all_operations() const
{
  std::vector<const OperationSignature *> out;
  out.reserve(operations.size());
  for (const auto & op : operations) {
    out.push_back(&op);
  }
  collect_nested(nested, out);
  return out;
}

bool StructureDef::declares_operation(std::string_view op) const
{
  const auto ops = all_operations();
  return std::any_of(
    ops.begin(), ops.end(), [&](const OperationSignature * s) { return s->name == op; });
}

std::string StructureDef::display_name() const
{
  if (params.empty()) {
    return name;
  }
  std::string out = name + "(";
  for (size_t i = 0; i < params.size(); ++i) {
    if (i > 0) out += ", ";
    out += params[i].name;
  }
  out += ")";
  return out;
}

// ============================================================================
// ImplementsDef
// ============================================================================

const ImplementsMember * ImplementsDef::find_member(std::string_view member_name) const noexcept
{
  const auto it = std::find_if(members.begin(), members.end(), [&](const ImplementsMember & m) {
    return m.name == member_name;
  });
  return it != members.end() ? &*it : nullptr;
}

std::string ImplementsDef::type_args_text() const
{
  std::string out;
  for (size_t i = 0; i < type_args.size(); ++i) {
    if (i > 0) out += ", ";
    out += to_canonical_string(type_args[i]);
  }
  return out;
}

std::string ImplementsDef::display_name() const
{
  if (type_args.empty()) {
    return structure_name;
  }
  return structure_name + "(" + type_args_text() + ")";
}

// ============================================================================
// DataDef
// ============================================================================

TypeExpr DataDef::self_type() const
{
  if (params.empty()) {
    return TypeExpr::named(name, name_range);
  }
  std::vector<TypeExpr> args;
  args.reserve(params.size());
  for (const auto & p : params) {
    args.push_back(TypeExpr::named(p.name, p.range));
  }
  return TypeExpr::parametric(name, std::move(args), name_range);
}

OperationSignature DataDef::constructor_signature(const DataVariant & variant) const
{
  // Built directly: a product field must stay one parameter.
  OperationSignature sig;
  sig.name = variant.name;
  sig.params = variant.fields;
  sig.result = self_type();
  sig.type = sig.result;
  for (auto it = variant.fields.rbegin(); it != variant.fields.rend(); ++it) {
    sig.type = TypeExpr::function(*it, std::move(sig.type), variant.range);
  }
  sig.is_element = variant.fields.empty();
  sig.range = variant.range;
  return sig;
}

// ============================================================================
// StructureProgram
// ============================================================================

void StructureProgram::append(StructureProgram && other)
{
  declarations.insert(
    declarations.end(), std::make_move_iterator(other.declarations.begin()),
    std::make_move_iterator(other.declarations.end()));
  other.declarations.clear();
}

}  // namespace kleis
