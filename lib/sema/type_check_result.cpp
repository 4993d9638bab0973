// kleis/sema/type_check_result.cpp
#include "kleis/sema/type_check_result.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace kleis
{

std::string to_string(const TypeCheckResult & result)
{
  if (result.is_success()) {
    return to_string(result.as_success().type);
  }
  if (result.is_error()) {
    const auto & err = result.as_error();
    if (err.suggestion) {
      return fmt::format("error: {} ({})", err.message, *err.suggestion);
    }
    return fmt::format("error: {}", err.message);
  }
  const auto & poly = result.as_polymorphic();
  if (poly.available_types.empty()) {
    return fmt::format("polymorphic {}", to_string(poly.type_var));
  }
  return fmt::format(
    "polymorphic {} (available: {})", to_string(poly.type_var),
    fmt::join(poly.available_types, ", "));
}

}  // namespace kleis
