#pragma once

#include <string>
#include <utility>

namespace chronicle::db {

/*
  Outcome of a repository write.

  Backends map sqlite return codes and pqxx exception types onto
  ErrorCode; nothing above internal/db sees a driver type. Reads report
  failure by throwing and return absence as std::nullopt.
*/

enum class ErrorCode {
  OK = 0,

  // lost races: a concurrent writer got there first
  NotFound,
  AlreadyExists,
  Conflict,
  SerializationFailure,

  // the store could not do the work
  Busy,
  ConstraintViolation,
  IOError,
  Corruption,
  InternalError,
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // Conflict, AlreadyExists or SerializationFailure: a retry with fresh
  // state may succeed. NotFound is not a race.
  bool IsRace() const {
    return code == ErrorCode::Conflict || code == ErrorCode::AlreadyExists || code == ErrorCode::SerializationFailure;
  }

  // "<code>: <message>" for error reports.
  std::string Describe() const {
    return std::string(ToString(code)) + ": " + message;
  }
};

} // namespace chronicle::db
