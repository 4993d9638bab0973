// kleis/driver/type_checker.cpp - Type checker facade implementation
//
#include "kleis/driver/type_checker.hpp"

#include <fstream>
#include <sstream>

#include <fmt/core.h>

#include "kleis/driver/stdlib_finder.hpp"
#include "kleis/syntax/frontend.hpp"

namespace kleis
{

namespace fs = std::filesystem;

namespace
{

std::string_view code_for(TypeErrorKind kind)
{
  switch (kind) {
    case TypeErrorKind::DuplicateName:
      return diag_code::k_duplicate_name;
    case TypeErrorKind::UnknownStructure:
      return diag_code::k_unknown_structure;
    case TypeErrorKind::CyclicDependency:
      return diag_code::k_cyclic_dependency;
    default:
      return diag_code::k_invalid_signature;
  }
}

void report(
  DiagnosticBag & diags, SourceRange range, const TypeError & err, SourceRange earlier = {})
{
  auto builder = diags.report_error(range, err.message);
  builder.with_code(code_for(err.kind));
  if (err.kind == TypeErrorKind::DuplicateName && earlier.is_valid()) {
    builder.with_secondary_label(earlier, "first declared here");
  }
  if (err.suggestion) {
    builder.with_help(*err.suggestion);
  }
}

// Name range of the structure or data type already registered as `name`.
SourceRange declared_at(const StructureRegistry & registry, std::string_view name)
{
  if (auto s = registry.find_structure(name)) {
    return s->name_range;
  }
  if (auto d = registry.find_data_type(name)) {
    return d->name_range;
  }
  return {};
}

}  // namespace

TypeChecker::TypeChecker(CheckerOptions options) : options_(options) {}

// ============================================================================
// Construction
// ============================================================================

CheckerLoadResult TypeChecker::with_standard_library(
  CheckerOptions options, std::optional<fs::path> stdlib_dir)
{
  CheckerLoadResult out;
  out.checker = std::make_unique<TypeChecker>(options);

  if (!stdlib_dir) {
    stdlib_dir = find_stdlib();
  }
  if (!stdlib_dir) {
    out.diagnostics.report_error(SourceRange{}, "standard library not found")
      .with_code(diag_code::k_unreadable_file)
      .with_help("set checker.stdlib_path in kleis.yaml, or disable it with checker.stdlib: false");
    return out;
  }

  std::vector<fs::path> files;
  for (const auto name : stdlib_files()) {
    files.push_back(*stdlib_dir / fs::path(std::string(name)));
  }

  LoadResult loaded = out.checker->load_files(files);
  out.diagnostics = std::move(loaded.diagnostics);
  out.success = loaded.success;
  return out;
}

CheckerLoadResult TypeChecker::from_project(const ProjectConfig & config, CheckerOptions options)
{
  options.dispatch = config.checker.dispatch;

  CheckerLoadResult out;
  if (config.checker.stdlib) {
    out = with_standard_library(options, config.checker.stdlib_path);
    if (!out.success) {
      return out;
    }
  } else {
    out.checker = std::make_unique<TypeChecker>(options);
    out.success = true;
  }

  if (!config.checker.load.empty()) {
    LoadResult loaded = out.checker->load_files(config.checker.load);
    out.diagnostics.merge(std::move(loaded.diagnostics));
    out.success = loaded.success;
  }
  return out;
}

// ============================================================================
// Loading
// ============================================================================

LoadResult TypeChecker::load_source(std::string text, const fs::path & virtual_path)
{
  DiagnosticBag diags;
  ParseOutput parsed = parse_source(sources_, virtual_path, std::move(text), diags);
  std::vector<StructureProgram> programs;
  programs.push_back(std::move(parsed.program));
  return commit(std::move(programs), std::move(diags));
}

LoadResult TypeChecker::load_file(const fs::path & path) { return load_files({path}); }

LoadResult TypeChecker::load_files(const std::vector<fs::path> & paths)
{
  DiagnosticBag diags;
  std::vector<StructureProgram> programs;

  for (const auto & path : paths) {
    std::ifstream file(path);
    if (!file.is_open()) {
      diags.report_error(SourceRange{}, "cannot open structure file: " + path.string())
        .with_code(diag_code::k_unreadable_file);
      continue;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    ParseOutput parsed = parse_source(sources_, path, buffer.str(), diags);
    programs.push_back(std::move(parsed.program));
  }

  return commit(std::move(programs), std::move(diags));
}

LoadResult TypeChecker::load(StructureProgram program)
{
  std::vector<StructureProgram> programs;
  programs.push_back(std::move(program));
  return commit(std::move(programs), DiagnosticBag{});
}

LoadResult TypeChecker::commit(std::vector<StructureProgram> programs, DiagnosticBag diags)
{
  LoadResult result;

  // Nothing is registered from sources that did not read or parse.
  if (diags.has_errors()) {
    result.diagnostics = std::move(diags);
    return result;
  }

  StructureRegistry next = registry_;

  for (auto & program : programs) {
    for (auto & decl : program.declarations) {
      if (auto * s = std::get_if<StructureDef>(&decl)) {
        const SourceRange range = s->name_range;
        const SourceRange earlier = declared_at(next, s->name);
        auto r = next.register_structure(std::move(*s));
        if (!r.success()) report(diags, range, *r.error, earlier);
        continue;
      }

      if (auto * d = std::get_if<DataDef>(&decl)) {
        const SourceRange range = d->name_range;
        const SourceRange earlier = declared_at(next, d->name);
        auto r = next.register_data(std::move(*d));
        if (!r.success()) report(diags, range, *r.error, earlier);
        continue;
      }

      if (auto * impl = std::get_if<ImplementsDef>(&decl)) {
        const SourceRange range = impl->range;
        if (auto target = next.find_structure(impl->structure_name)) {
          for (const auto & member : impl->members) {
            if (!target->declares_operation(member.name)) {
              diags
                .report_warning(
                  member.range, fmt::format(
                                  "structure '{}' has no operation '{}'", target->name,
                                  member.name))
                .with_code(diag_code::k_invalid_signature);
            }
          }
        }
        auto r = next.register_implements(std::move(*impl));
        if (!r.success()) report(diags, range, *r.error);
        continue;
      }

      auto & op = std::get<OperationSignature>(decl);
      const SourceRange range = op.range;
      auto r = next.register_operation(std::move(op));
      if (!r.success()) report(diags, range, *r.error);
    }
  }

  if (!diags.has_errors()) {
    auto valid = next.validate();
    if (!valid.success()) {
      SourceRange range;
      if (!valid.error->path.empty()) {
        if (auto s = next.find_structure(valid.error->path.front())) {
          range = s->name_range;
        }
      }
      report(diags, range, *valid.error);
    }
  }

  result.diagnostics = std::move(diags);
  if (result.diagnostics.has_errors()) {
    return result;
  }

  result.structures = next.structure_count() - registry_.structure_count();
  result.implementations = next.implementation_count() - registry_.implementation_count();
  result.candidates = next.candidate_count() - registry_.candidate_count();
  result.data_types = next.data_type_count() - registry_.data_type_count();
  registry_ = std::move(next);
  result.success = true;
  return result;
}

TypePtr TypeChecker::bind(const std::string & name, const TypeExpr & type)
{
  InferenceSession session(next_binding_var_);
  const SignatureInterpreter interpreter(registry_, types_);
  TypePtr bound = interpreter.convert(type, binding_scope_, session, [&](std::string_view n) {
    return interpreter.is_unknown_lowercase_name(n);
  });
  next_binding_var_ = session.next_id();
  bindings_[name] = bound;
  return bound;
}

// ============================================================================
// Checking
// ============================================================================

InferenceDriver TypeChecker::make_driver() const
{
  InferenceOptions o;
  o.dispatch = options_.dispatch;
  o.trace = options_.trace;
  return InferenceDriver(registry_, types_, o);
}

TypeCheckResult TypeChecker::check(const Expression & expr) const
{
  return make_driver().check(expr, bindings_);
}

InferResult TypeChecker::infer(const Expression & expr, const TypeEnvironment & environment) const
{
  TypeEnvironment merged = bindings_;
  for (const auto & [name, type] : environment) {
    merged[name] = type;
  }

  InferenceSession session = InferenceSession::with_environment(std::move(merged));
  InferOutcome outcome = make_driver().infer(expr, session);
  if (!outcome.success()) {
    return InferResult::fail(outcome.error->message);
  }
  return InferResult::ok(std::move(outcome.type));
}

std::optional<std::string> TypeChecker::suggest_operation(std::string_view op) const
{
  return make_driver().suggest_operation(op);
}

}  // namespace kleis
