// kleisc - Kleis type checker command line interface
//
// Usage:
//   kleisc check <expr.json>       (use - for stdin)
//   kleisc types <operation>
//   kleisc structures
//   kleisc load <file.kleis>...
//
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include "kleis/ast/json_codec.hpp"
#include "kleis/basic/diagnostic_printer.hpp"
#include "kleis/driver/type_checker.hpp"
#include "kleis/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "Kleis type checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check <expr.json>        Type-check an expression (JSON wire form, - for stdin)\n"
            << "  types <operation>        List the types supporting an operation\n"
            << "  structures               List loaded structures\n"
            << "  load <file.kleis>...     Load structure files and report diagnostics\n\n"
            << "Options:\n"
            << "  --no-stdlib              Do not load the standard library\n"
            << "  --load <file.kleis>      Load a structure file first (repeatable)\n"
            << "  --project                Configure from kleis.yaml\n"
            << "  --json                   Machine-readable output\n"
            << "  -v, --verbose            Trace loading and candidate dispatch\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const kleis::DiagnosticBag & diagnostics, const kleis::TypeChecker * checker)
{
  if (diagnostics.empty()) {
    return;
  }
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  kleis::DiagnosticPrinter printer(std::cerr, use_color);
  if (checker != nullptr) {
    printer.print_all(diagnostics, checker->sources());
  } else {
    const kleis::SourceRegistry empty;
    printer.print_all(diagnostics, empty);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> inputs;
  std::vector<std::string> load_paths;
  bool use_project = false;
  bool no_stdlib = false;
  bool json = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--load") {
      if (i + 1 < argc) {
        args.load_paths.emplace_back(argv[++i]);
      }
    } else if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--no-stdlib") {
      args.no_stdlib = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "-" || arg[0] != '-') {
      args.inputs.push_back(arg);
    } else {
      std::cerr << "warning: ignoring unknown option '" << arg << "'\n";
    }
  }

  return args;
}

// ============================================================================
// Checker setup
// ============================================================================

/// Build the checker from the options; prints diagnostics and returns null on failure
std::unique_ptr<kleis::TypeChecker> make_checker(const CommandArgs & args)
{
  kleis::CheckerOptions options;
  if (args.verbose) {
    options.trace = &std::cerr;
  }

  kleis::CheckerLoadResult loaded;

  if (args.use_project) {
    auto config_path = kleis::find_project_config(fs::current_path());
    if (!config_path) {
      std::cerr << "error: no kleis.yaml found in current directory or parents\n";
      return nullptr;
    }

    const auto config_result = kleis::load_project_config(*config_path);
    if (!config_result.success) {
      std::cerr << "error: " << config_result.error << "\n";
      return nullptr;
    }

    kleis::ProjectConfig config = config_result.config;
    if (args.no_stdlib) {
      config.checker.stdlib = false;
    }
    if (args.verbose) {
      std::cerr << "Project: " << config.package.name << " (dispatch "
                << kleis::to_string(config.checker.dispatch) << ")\n";
    }
    loaded = kleis::TypeChecker::from_project(config, options);
  } else if (args.no_stdlib) {
    loaded.checker = std::make_unique<kleis::TypeChecker>(options);
    loaded.success = true;
  } else {
    loaded = kleis::TypeChecker::with_standard_library(options);
  }

  if (loaded.success && !args.load_paths.empty()) {
    std::vector<fs::path> paths(args.load_paths.begin(), args.load_paths.end());
    auto extra = loaded.checker->load_files(paths);
    loaded.diagnostics.merge(std::move(extra.diagnostics));
    loaded.success = extra.success;
  }

  print_diagnostics(loaded.diagnostics, loaded.checker.get());
  if (!loaded.success) {
    return nullptr;
  }

  if (args.verbose) {
    const auto & registry = loaded.checker->registry();
    std::cerr << fmt::format(
      "Loaded {} structures, {} implementations, {} operation candidates\n",
      registry.structure_count(), registry.implementation_count(), registry.candidate_count());
  }
  return std::move(loaded.checker);
}

bool read_input(const std::string & input, std::string & out)
{
  if (input == "-") {
    std::stringstream buffer;
    buffer << std::cin.rdbuf();
    out = buffer.str();
    return true;
  }

  std::ifstream file(input);
  if (!file.is_open()) {
    std::cerr << "error: failed to open file: " << input << "\n";
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  if (args.inputs.size() != 1) {
    std::cerr << "error: expression file required\n";
    std::cerr << "usage: kleisc check <expr.json>\n";
    return 1;
  }

  std::string text;
  if (!read_input(args.inputs.front(), text)) {
    return 1;
  }

  const auto parsed = kleis::parse_expression_json(text);
  if (!parsed.success()) {
    std::cerr << "error: " << parsed.error << "\n";
    return 1;
  }

  auto checker = make_checker(args);
  if (!checker) {
    return 1;
  }

  const kleis::TypeCheckResult result = checker->check(*parsed.expr);

  if (args.json) {
    std::cout << kleis::to_json(result).dump(2) << "\n";
  } else if (result.is_success()) {
    std::cout << kleis::to_string(result.as_success().type) << "\n";
  } else if (result.is_polymorphic()) {
    const auto & poly = result.as_polymorphic();
    std::cout << kleis::to_string(poly.type_var) << " (polymorphic)\n";
    if (!poly.available_types.empty()) {
      std::cout << "available for: " << fmt::format("{}", fmt::join(poly.available_types, ", "))
                << "\n";
    }
  } else {
    const auto & err = result.as_error();
    std::cerr << "error[" << kleis::to_string(err.kind) << "]: " << err.message << "\n";
    if (err.suggestion) {
      std::cerr << "  = help: " << *err.suggestion << "\n";
    }
  }

  return result.is_error() ? 1 : 0;
}

int cmd_types(const CommandArgs & args)
{
  if (args.inputs.size() != 1) {
    std::cerr << "error: operation name required\n";
    std::cerr << "usage: kleisc types <operation>\n";
    return 1;
  }

  auto checker = make_checker(args);
  if (!checker) {
    return 1;
  }

  const std::string & op = args.inputs.front();
  const auto types = checker->types_supporting(op);

  if (args.json) {
    std::cout << nlohmann::json{{"operation", op}, {"types", types}}.dump(2) << "\n";
    return 0;
  }

  if (types.empty()) {
    std::cout << "no types support '" << op << "'\n";
    return 0;
  }
  for (const auto & t : types) {
    std::cout << t << "\n";
  }
  return 0;
}

int cmd_structures(const CommandArgs & args)
{
  auto checker = make_checker(args);
  if (!checker) {
    return 1;
  }

  const auto & registry = checker->registry();

  if (args.json) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto & name : registry.structure_names()) {
      const auto s = registry.find_structure(name);
      std::vector<std::string> impls;
      for (const auto & impl : registry.implementations_of(name)) {
        impls.push_back(impl->type_args_text());
      }
      out.push_back(
        {{"name", s->display_name()},
         {"operations", s->all_operations().size()},
         {"implementations", impls}});
    }
    for (const auto & data : registry.data_types()) {
      std::vector<std::string> variants;
      for (const auto & v : data->variants) {
        variants.push_back(v.name);
      }
      out.push_back({{"name", kleis::to_string(data->self_type())}, {"variants", variants}});
    }
    std::cout << out.dump(2) << "\n";
    return 0;
  }

  for (const auto & name : registry.structure_names()) {
    const auto s = registry.find_structure(name);
    std::cout << s->display_name();
    const auto impls = registry.implementations_of(name);
    if (!impls.empty()) {
      std::vector<std::string> texts;
      for (const auto & impl : impls) {
        texts.push_back(impl->type_args_text());
      }
      std::cout << fmt::format("  implemented for: {}", fmt::join(texts, "; "));
    }
    std::cout << "\n";
  }
  for (const auto & data : registry.data_types()) {
    std::vector<std::string> variants;
    for (const auto & v : data->variants) {
      variants.push_back(v.name);
    }
    std::cout << fmt::format(
      "data {} = {}\n", kleis::to_string(data->self_type()), fmt::join(variants, " | "));
  }
  return 0;
}

int cmd_load(const CommandArgs & args)
{
  if (args.inputs.empty()) {
    std::cerr << "error: structure file required\n";
    std::cerr << "usage: kleisc load <file.kleis>...\n";
    return 1;
  }

  auto checker = make_checker(args);
  if (!checker) {
    return 1;
  }

  std::vector<fs::path> paths(args.inputs.begin(), args.inputs.end());
  auto result = checker->load_files(paths);
  print_diagnostics(result.diagnostics, checker.get());

  if (!result.success) {
    return 1;
  }

  std::cout << fmt::format(
    "OK: {} structures, {} data types, {} implementations, {} operation candidates\n",
    result.structures, result.data_types, result.implementations, result.candidates);
  return 0;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "types") {
    return cmd_types(args);
  }

  if (args.command == "structures") {
    return cmd_structures(args);
  }

  if (args.command == "load") {
    return cmd_load(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}
