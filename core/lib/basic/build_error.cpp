// xelogen/basic/build_error.cpp - Graph construction errors
#include "xelogen/basic/build_error.hpp"

namespace xelogen
{

std::string_view error_code_name(ErrorCode code) noexcept
{
  switch (code) {
    case ErrorCode::UnknownNodeType:
      return "UnknownNodeType";
    case ErrorCode::UnknownPort:
      return "UnknownPort";
    case ErrorCode::TypeMismatch:
      return "TypeMismatch";
    case ErrorCode::DuplicateBinding:
      return "DuplicateBinding";
    case ErrorCode::NoMatchingOutput:
      return "NoMatchingOutput";
    case ErrorCode::NoContentSlot:
      return "NoContentSlot";
    case ErrorCode::ContentTypeMismatch:
      return "ContentTypeMismatch";
    case ErrorCode::NotAnImpulse:
      return "NotAnImpulse";
    case ErrorCode::NotABoolean:
      return "NotABoolean";
    case ErrorCode::NotAList:
      return "NotAList";
    case ErrorCode::MissingImpulseInput:
      return "MissingImpulseInput";
    case ErrorCode::MissingImpulseOutput:
      return "MissingImpulseOutput";
    case ErrorCode::UnsupportedCombination:
      return "UnsupportedCombination";
    case ErrorCode::DanglingElse:
      return "DanglingElse";
    case ErrorCode::ForeignNode:
      return "ForeignNode";
    case ErrorCode::UnbalancedScope:
      return "UnbalancedScope";
  }
  return "Unknown";
}

BuildError::BuildError(ErrorCode code, const std::string & message)
: std::runtime_error(std::string(error_code_name(code)) + ": " + message), code_(code)
{
}

}  // namespace xelogen
