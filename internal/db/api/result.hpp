#pragma once

#include <cstdint>
#include <string>

namespace sitely::db {

/*
  Portable DB result codes.

  The repository layer must translate backend errors into these.
  Upper layers should never depend on sqlite error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Busy,

  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

struct Result {
  ErrorCode     code = ErrorCode::OK;
  std::string   message;
  std::uint64_t affected_rows = 0;

  static Result Ok(std::uint64_t affected = 0) {
    Result r;
    r.affected_rows = affected;
    return r;
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    Result r;
    r.code    = c;
    r.message = std::move(msg);
    return r;
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

// Insert behavior for rows keyed by their own id.
enum class InsertMode {
  kStrict,         // duplicate id -> AlreadyExists
  kIgnoreExisting, // duplicate id -> OK with affected_rows == 0
};

} // namespace sitely::db
