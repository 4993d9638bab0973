// kleis/sema/inference_session.cpp
#include "kleis/sema/inference_session.hpp"

#include <algorithm>

namespace kleis
{

InferenceSession InferenceSession::with_environment(TypeEnvironment environment)
{
  int64_t max_id = -1;
  for (const auto & [name, type] : environment) {
    if (type) {
      max_id = std::max(max_id, type->max_var_id());
    }
  }
  InferenceSession session(static_cast<TypeVarId>(max_id + 1));
  session.environment_ = std::move(environment);
  return session;
}

}  // namespace kleis
