// kleis/ast/json_codec.cpp - JSON wire form implementation
//
#include "kleis/ast/json_codec.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace kleis
{
namespace
{

using nlohmann::json;

// ============================================================================
// Decoding
// ============================================================================

std::optional<Expression> decode(const json & j, const std::string & where, std::string & error);

std::optional<std::vector<Expression>> decode_array(
  const json & j, const std::string & where, std::string & error)
{
  if (!j.is_array()) {
    error = where + ": expected an array";
    return std::nullopt;
  }
  std::vector<Expression> out;
  out.reserve(j.size());
  for (size_t i = 0; i < j.size(); ++i) {
    auto item = decode(j[i], where + "/" + std::to_string(i), error);
    if (!item) {
      return std::nullopt;
    }
    out.push_back(std::move(*item));
  }
  return out;
}

std::optional<Expression> decode(const json & j, const std::string & where, std::string & error)
{
  if (!j.is_object() || j.size() != 1) {
    error = where +
            ": expected an object with one of Const, Object, Placeholder, Operation, List";
    return std::nullopt;
  }

  const auto it = j.begin();
  const std::string & tag = it.key();
  const json & body = it.value();
  const std::string here = where + "/" + tag;

  if (tag == "Const") {
    // Numbers are accepted unquoted too.
    if (body.is_number()) {
      return Expression::constant(body.dump());
    }
    if (!body.is_string()) {
      error = here + ": expected a string";
      return std::nullopt;
    }
    return Expression::constant(body.get<std::string>());
  }

  if (tag == "Object") {
    if (!body.is_string()) {
      error = here + ": expected a string";
      return std::nullopt;
    }
    return Expression::object(body.get<std::string>());
  }

  if (tag == "Placeholder") {
    if (!body.is_object() || !body.contains("id") || !body["id"].is_number_unsigned()) {
      error = here + ": expected {\"id\": <natural>, \"hint\": <string>}";
      return std::nullopt;
    }
    const auto id = body["id"].get<uint64_t>();
    if (id > std::numeric_limits<uint32_t>::max()) {
      error = here + "/id: placeholder id " + std::to_string(id) + " is out of range";
      return std::nullopt;
    }
    std::string hint;
    if (body.contains("hint") && body["hint"].is_string()) {
      hint = body["hint"].get<std::string>();
    }
    return Expression::placeholder(static_cast<uint32_t>(id), std::move(hint));
  }

  if (tag == "Operation") {
    if (!body.is_object() || !body.contains("name") || !body["name"].is_string()) {
      error = here + ": expected {\"name\": <string>, \"args\": [...]}";
      return std::nullopt;
    }
    std::vector<Expression> args;
    if (body.contains("args")) {
      auto decoded = decode_array(body["args"], here + "/args", error);
      if (!decoded) {
        return std::nullopt;
      }
      args = std::move(*decoded);
    }
    return Expression::operation(body["name"].get<std::string>(), std::move(args));
  }

  if (tag == "List") {
    auto items = decode_array(body, here, error);
    if (!items) {
      return std::nullopt;
    }
    return Expression::list(std::move(*items));
  }

  error = where + ": unknown expression tag '" + tag + "'";
  return std::nullopt;
}

std::string_view kind_name(TypeKind kind)
{
  switch (kind) {
    case TypeKind::Var:
      return "Var";
    case TypeKind::Data:
      return "Data";
    case TypeKind::NatValue:
      return "NatValue";
    case TypeKind::Function:
      return "Function";
    case TypeKind::Product:
      return "Product";
    case TypeKind::String:
      return "String";
  }
  return "Unknown";
}

json type_node(const Type & t)
{
  json j{{"kind", std::string(kind_name(t.kind))}};
  switch (t.kind) {
    case TypeKind::Var:
      j["id"] = t.var_id;
      break;
    case TypeKind::Data: {
      j["type_name"] = t.type_name;
      j["constructor"] = t.constructor;
      json args = json::array();
      for (const auto & a : t.args) args.push_back(type_node(*a));
      j["args"] = std::move(args);
      break;
    }
    case TypeKind::NatValue:
      j["value"] = t.nat;
      break;
    case TypeKind::Function:
      j["domain"] = type_node(*t.domain());
      j["codomain"] = type_node(*t.codomain());
      break;
    case TypeKind::Product: {
      json elements = json::array();
      for (const auto & e : t.args) elements.push_back(type_node(*e));
      j["elements"] = std::move(elements);
      break;
    }
    case TypeKind::String:
      break;
  }
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

ExpressionParseResult expression_from_json(const json & j)
{
  std::string error;
  auto expr = decode(j, "", error);
  if (!expr) {
    return ExpressionParseResult::fail(error);
  }
  return ExpressionParseResult::ok(std::move(*expr));
}

ExpressionParseResult parse_expression_json(std::string_view text)
{
  json j;
  try {
    j = json::parse(text);
  } catch (const json::parse_error & e) {
    return ExpressionParseResult::fail(std::string("invalid JSON: ") + e.what());
  }
  return expression_from_json(j);
}

json to_json(const Expression & expr)
{
  switch (expr.kind()) {
    case ExprKind::Const:
      return json{{"Const", expr.text()}};
    case ExprKind::Object:
      return json{{"Object", expr.text()}};
    case ExprKind::Placeholder:
      return json{{"Placeholder", {{"id", expr.placeholder_id()}, {"hint", expr.text()}}}};
    case ExprKind::Operation: {
      json args = json::array();
      for (const auto & a : expr.args()) args.push_back(to_json(a));
      return json{{"Operation", {{"name", expr.text()}, {"args", std::move(args)}}}};
    }
    case ExprKind::List: {
      json items = json::array();
      for (const auto & a : expr.args()) items.push_back(to_json(a));
      return json{{"List", std::move(items)}};
    }
  }
  return nullptr;
}

json to_json(const TypePtr & type)
{
  if (!type) {
    return nullptr;
  }
  json j = type_node(*type);
  j["display"] = to_string(type);
  return j;
}

json to_json(const TypeCheckResult & result)
{
  if (result.is_success()) {
    return json{{"status", "success"}, {"type", to_json(result.as_success().type)}};
  }
  if (result.is_error()) {
    const auto & err = result.as_error();
    json j{
      {"status", "error"},
      {"kind", std::string(to_string(err.kind))},
      {"message", err.message}};
    j["suggestion"] = err.suggestion ? json(*err.suggestion) : json(nullptr);
    return j;
  }
  const auto & poly = result.as_polymorphic();
  return json{
    {"status", "polymorphic"},
    {"type_var", to_json(poly.type_var)},
    {"available_types", poly.available_types}};
}

}  // namespace kleis
