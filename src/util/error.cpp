// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/error.hpp"

namespace rdvp {
namespace util {

const char *ErrorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::Canceled:
    return "Canceled";
  case ErrorCode::HelpRequested:
    return "HelpRequested";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::DecodeError:
    return "DecodeError";
  case ErrorCode::KeyFormatError:
    return "KeyFormatError";
  case ErrorCode::KeyGenError:
    return "KeyGenError";
  case ErrorCode::AddressParseError:
    return "AddressParseError";
  case ErrorCode::HostError:
    return "HostError";
  case ErrorCode::StorageError:
    return "StorageError";
  case ErrorCode::ServiceError:
    return "ServiceError";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

Error::Error(ErrorCode code, const std::string &message)
    : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + message),
      code_(code), message_(message) {}

void RethrowWrapped(ErrorCode code, const std::string &context) {
  try {
    throw;
  } catch (const Error &) {
    throw;
  } catch (const std::exception &e) {
    throw Error(code, context + ": " + e.what());
  }
}

std::exception_ptr MakeCanceledError(const std::string &message) {
  return std::make_exception_ptr(Error(ErrorCode::Canceled, message));
}

bool HasErrorCode(const std::exception_ptr &e, ErrorCode code) {
  if (!e) {
    return false;
  }
  try {
    std::rethrow_exception(e);
  } catch (const Error &err) {
    return err.code() == code;
  } catch (...) {
    return false;
  }
}

bool IsCancellation(const std::exception_ptr &e) {
  return HasErrorCode(e, ErrorCode::Canceled);
}

std::string DescribeError(const std::exception_ptr &e) {
  if (!e) {
    return "";
  }
  try {
    std::rethrow_exception(e);
  } catch (const std::exception &ex) {
    return ex.what();
  } catch (...) {
    return "unknown error";
  }
}

} // namespace util
} // namespace rdvp
