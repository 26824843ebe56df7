#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace wf::engine {

enum class ErrorCode {
  InvalidSpecification,
  MalformedSelector,
  UnknownReference,
  KindMismatch,
  CyclicWorkflow,
  InvalidInput,
  StepExecution,
  UnresolvedValue,
  Cancelled,
  DeadlineExceeded,
  Transport,
  MalformedWorkflowResponse,
  Io,
};

struct EngineError {
  ErrorCode code = ErrorCode::InvalidSpecification;
  std::string message;
  /// Failing step for StepExecution errors.
  std::string step;
  /// Root cause reported by the block for StepExecution errors.
  std::string cause;
};

template <typename T>
using Expected = tl::expected<T, EngineError>;

inline auto make_error(ErrorCode code, std::string message) -> EngineError {
  return EngineError{code, std::move(message), {}, {}};
}

inline auto make_step_error(std::string step, std::string cause) -> EngineError {
  EngineError error;
  error.code = ErrorCode::StepExecution;
  error.message = "step '" + step + "' failed: " + cause;
  error.step = std::move(step);
  error.cause = std::move(cause);
  return error;
}

constexpr auto error_code_name(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::InvalidSpecification:
      return "InvalidSpecificationError";
    case ErrorCode::MalformedSelector:
      return "MalformedSelectorError";
    case ErrorCode::UnknownReference:
      return "UnknownReferenceError";
    case ErrorCode::KindMismatch:
      return "KindMismatchError";
    case ErrorCode::CyclicWorkflow:
      return "CyclicWorkflowError";
    case ErrorCode::InvalidInput:
      return "InvalidInputError";
    case ErrorCode::StepExecution:
      return "StepExecutionError";
    case ErrorCode::UnresolvedValue:
      return "UnresolvedValueError";
    case ErrorCode::Cancelled:
      return "CancelledError";
    case ErrorCode::DeadlineExceeded:
      return "DeadlineExceededError";
    case ErrorCode::Transport:
      return "TransportError";
    case ErrorCode::MalformedWorkflowResponse:
      return "MalformedWorkflowResponseError";
    case ErrorCode::Io:
      return "IoError";
  }
  return "UnknownError";
}

inline auto to_string(const EngineError& error) -> std::string {
  std::string text(error_code_name(error.code));
  text += ": ";
  text += error.message;
  return text;
}

}  // namespace wf::engine
