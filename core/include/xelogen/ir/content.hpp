// xelogen/ir/content.hpp - Literal content held by literal nodes
//
// Literal holder nodes (IntInput, StringInput, BoolInput, ...) carry a value
// whose kind must match the content type declared by their NodeSpec.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "xelogen/ir/datatype.hpp"

namespace xelogen
{

/**
 * Literal content value.
 *
 * Stores one of:
 * - Int as int64_t
 * - Float as double
 * - Bool
 * - String (owned)
 */
class ContentValue
{
public:
  // ===========================================================================
  // Factory Methods
  // ===========================================================================

  static ContentValue make_int(int64_t value) { return ContentValue(Storage(value)); }

  static ContentValue make_float(double value) { return ContentValue(Storage(value)); }

  static ContentValue make_bool(bool value) { return ContentValue(Storage(value)); }

  static ContentValue make_string(std::string value)
  {
    return ContentValue(Storage(std::move(value)));
  }

  // ===========================================================================
  // Kind Queries
  // ===========================================================================

  /// Runtime kind of the value, expressed as a scalar datatype
  [[nodiscard]] Datatype kind() const noexcept;

  [[nodiscard]] bool is_int() const noexcept { return std::holds_alternative<int64_t>(value_); }
  [[nodiscard]] bool is_float() const noexcept { return std::holds_alternative<double>(value_); }
  [[nodiscard]] bool is_bool() const noexcept { return std::holds_alternative<bool>(value_); }
  [[nodiscard]] bool is_string() const noexcept
  {
    return std::holds_alternative<std::string>(value_);
  }

  // ===========================================================================
  // Value Accessors (only valid for the matching kind)
  // ===========================================================================

  [[nodiscard]] int64_t as_int() const { return std::get<int64_t>(value_); }
  [[nodiscard]] double as_float() const { return std::get<double>(value_); }
  [[nodiscard]] bool as_bool() const { return std::get<bool>(value_); }
  [[nodiscard]] std::string_view as_string() const { return std::get<std::string>(value_); }

  /// Human-readable rendering ("42", "true", "\"World\"", ...)
  [[nodiscard]] std::string to_string() const;

  friend bool operator==(const ContentValue & a, const ContentValue & b)
  {
    return a.value_ == b.value_;
  }
  friend bool operator!=(const ContentValue & a, const ContentValue & b) { return !(a == b); }

private:
  using Storage = std::variant<int64_t, double, bool, std::string>;

  explicit ContentValue(Storage value) : value_(std::move(value)) {}

  Storage value_;
};

}  // namespace xelogen
