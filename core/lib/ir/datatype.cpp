// xelogen/ir/datatype.cpp - Port datatypes
#include "xelogen/ir/datatype.hpp"

#include <array>
#include <string>
#include <utility>

#include "xelogen/basic/build_error.hpp"

namespace xelogen
{

namespace
{

constexpr std::array<std::pair<std::string_view, Datatype>, 9> k_datatype_names = {{
  {"Impulse", Datatype::Impulse},
  {"ImpulseList", Datatype::ImpulseList},
  {"Float", Datatype::Float},
  {"Int", Datatype::Int},
  {"IntList", Datatype::IntList},
  {"String", Datatype::String},
  {"StringList", Datatype::StringList},
  {"Slot", Datatype::Slot},
  {"Bool", Datatype::Bool},
}};

}  // namespace

Datatype element_type(Datatype t)
{
  switch (t) {
    case Datatype::ImpulseList:
      return Datatype::Impulse;
    case Datatype::IntList:
      return Datatype::Int;
    case Datatype::StringList:
      return Datatype::String;
    default:
      break;
  }
  throw BuildError(
    ErrorCode::NotAList, "type " + std::string(to_string(t)) + " is not a list");
}

Datatype scalar_type(Datatype t) noexcept
{
  switch (t) {
    case Datatype::ImpulseList:
      return Datatype::Impulse;
    case Datatype::IntList:
      return Datatype::Int;
    case Datatype::StringList:
      return Datatype::String;
    default:
      return t;
  }
}

std::string_view to_string(Datatype t) noexcept
{
  for (const auto & [name, value] : k_datatype_names) {
    if (value == t) {
      return name;
    }
  }
  return "?";
}

std::optional<Datatype> datatype_from_string(std::string_view name) noexcept
{
  for (const auto & [n, value] : k_datatype_names) {
    if (n == name) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace xelogen
