// xelogen/ir/datatype.hpp - Port datatypes
//
// The closed set of datatypes carried by node ports. The *List kinds are only
// used for inputs that accept zero or more connections of their element kind:
// ImpulseList for every impulse input, the others for expandable inputs (the
// values of Plus nodes, ...).
//
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace xelogen
{

enum class Datatype : uint8_t {
  Impulse,
  ImpulseList,
  Float,
  Int,
  IntList,
  String,
  StringList,
  Slot,
  Bool,
};

/// Check whether `t` is a list datatype.
[[nodiscard]] constexpr bool is_list(Datatype t) noexcept
{
  return t == Datatype::ImpulseList || t == Datatype::IntList || t == Datatype::StringList;
}

/**
 * Get the element datatype of a list datatype.
 *
 * @throws BuildError (NotAList) if `t` is a scalar datatype
 */
[[nodiscard]] Datatype element_type(Datatype t);

/// `element_type(t)` for list datatypes, `t` itself otherwise.
[[nodiscard]] Datatype scalar_type(Datatype t) noexcept;

[[nodiscard]] std::string_view to_string(Datatype t) noexcept;

/**
 * Parse a datatype name ("Impulse", "IntList", ...).
 * @return std::nullopt if the name is not a datatype
 */
[[nodiscard]] std::optional<Datatype> datatype_from_string(std::string_view name) noexcept;

}  // namespace xelogen
