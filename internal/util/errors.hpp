#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"

namespace ledger::util {

/*
  Central error types.

  Repositories report db::Result codes; everything above them throws
  one of these. Exists() is the only operation that treats absence as
  data instead of failure.
*/

// A required precondition was not met (e.g. Create() without algorithm).
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unique identity (LFN) already taken.
class DuplicateError : public std::runtime_error {
 public:
  explicit DuplicateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Referenced file or block is not visible to the transaction.
class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Store failed for reasons outside the ledger (lock timeout, I/O,
// concurrent commit). Never retried here; the caller decides.
class TransientStoreError : public std::runtime_error {
 public:
  explicit TransientStoreError(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline void ThrowIfDbError(const ledger::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ledger::db::ErrorCode::AlreadyExists:
    case ledger::db::ErrorCode::ConstraintViolation:
      throw DuplicateError(message);
    case ledger::db::ErrorCode::NotFound:
      throw NotFoundError(message);
    case ledger::db::ErrorCode::Busy:
    case ledger::db::ErrorCode::Conflict:
    case ledger::db::ErrorCode::SerializationFailure:
    case ledger::db::ErrorCode::IOError:
      throw TransientStoreError(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace ledger::util
