#pragma once

#include <string>

namespace ledger::db {

/*
  Outcome of one ledger write.

  Each backend folds its native failures (sqlite extended codes, pqxx
  exception types) into these codes; util::ThrowIfDbError turns them
  into the ledger exceptions at the manager boundary:

    NotFound                          -> NotFoundError
    AlreadyExists, ConstraintViolation -> DuplicateError
    Busy, Conflict, SerializationFailure, IOError
                                      -> TransientStoreError
    Corruption, InternalError         -> std::runtime_error
*/
enum class ErrorCode {
  OK = 0,

  // file id, lfn or block the statement targets is not stored
  NotFound,
  // lfn or edge already present
  AlreadyExists,
  ConstraintViolation,

  // lock held by another connection
  Busy,
  Conflict,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace ledger::db
