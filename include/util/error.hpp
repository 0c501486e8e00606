// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Error taxonomy

 Every failure that leaves a component is an rdvp::util::Error carrying a
 stable categorical tag. Leaf components throw tagged errors directly;
 failures coming out of collaborators (host, store, service) are wrapped
 with the tag of the step that failed and propagated unchanged otherwise.

 Canceled is the only tag the process treats as non-fatal: it marks a
 task that stopped because the shared cancellation scope was cancelled
 (external signal or sibling termination).
*/

#include <exception>
#include <stdexcept>
#include <string>

namespace rdvp {
namespace util {

enum class ErrorCode {
  Canceled,
  HelpRequested,
  InvalidArgument,
  DecodeError,
  KeyFormatError,
  KeyGenError,
  AddressParseError,
  HostError,
  StorageError,
  ServiceError,
  Internal,
};

// Stable tag name ("DecodeError", "AddressParseError", ...)
const char *ErrorCodeName(ErrorCode code);

class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string &message);

  ErrorCode code() const noexcept { return code_; }

  // Message without the "<Tag>: " prefix
  const std::string &message() const noexcept { return message_; }

private:
  ErrorCode code_;
  std::string message_;
};

/**
 * Tag an exception coming out of a collaborator.
 *
 * An rdvp Error keeps its own tag (it was already categorised closer to
 * the failure); anything else becomes Error(code, context + ": " + what).
 */
[[noreturn]] void RethrowWrapped(ErrorCode code, const std::string &context);

// Error(Canceled, "context canceled")
std::exception_ptr MakeCanceledError(const std::string &message = "context canceled");

// True if e holds an Error tagged Canceled
bool IsCancellation(const std::exception_ptr &e);

// True if e holds an Error with the given tag
bool HasErrorCode(const std::exception_ptr &e, ErrorCode code);

// what() of the stored exception ("unknown error" for non-std exceptions)
std::string DescribeError(const std::exception_ptr &e);

} // namespace util
} // namespace rdvp
