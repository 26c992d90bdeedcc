// xelogen/ir/content.cpp - Literal content values
#include "xelogen/ir/content.hpp"

#include <fmt/core.h>

namespace xelogen
{

Datatype ContentValue::kind() const noexcept
{
  if (is_int()) return Datatype::Int;
  if (is_float()) return Datatype::Float;
  if (is_bool()) return Datatype::Bool;
  return Datatype::String;
}

std::string ContentValue::to_string() const
{
  if (is_int()) return fmt::format("{}", as_int());
  if (is_float()) return fmt::format("{}", as_float());
  if (is_bool()) return as_bool() ? "true" : "false";
  return fmt::format("\"{}\"", as_string());
}

}  // namespace xelogen
