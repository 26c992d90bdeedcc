// xelogen/basic/build_error.hpp - Graph construction errors
//
// Every violation of a construction rule (unknown names, port type mismatches,
// arity violations, misplaced Else, ...) is raised as a BuildError at the point
// of violation, before the graph is mutated.
//
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace xelogen
{

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : uint8_t {
  UnknownNodeType,
  UnknownPort,
  TypeMismatch,
  DuplicateBinding,
  NoMatchingOutput,
  NoContentSlot,
  ContentTypeMismatch,
  NotAnImpulse,
  NotABoolean,
  NotAList,
  MissingImpulseInput,
  MissingImpulseOutput,
  UnsupportedCombination,
  DanglingElse,
  ForeignNode,      ///< Output belongs to a different graph
  UnbalancedScope,  ///< Branch scope closed out of nesting order
};

/// Stable name of an error code (e.g. "DuplicateBinding").
[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// ============================================================================
// BuildError
// ============================================================================

/**
 * Exception thrown by graph construction operations.
 *
 * The message is prefixed with the code name, e.g.
 * "DuplicateBinding: input 'value' of node 3 <PlusOne<Int>> is already bound".
 */
class BuildError : public std::runtime_error
{
public:
  BuildError(ErrorCode code, const std::string & message);

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
  ErrorCode code_;
};

}  // namespace xelogen
