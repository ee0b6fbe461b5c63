#pragma once

#include <stdexcept>
#include <string>

namespace sitely::util {

/*
  Central error types.

  Repository Result codes are translated into these by the ledger store.
  The caller decides user-facing messaging.
*/

// Backing store unreachable or DDL rejected. Fatal at startup.
class SchemaError : public std::runtime_error {
 public:
  explicit SchemaError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A single legacy record could not be converted or inserted.
class MigrationRecordError : public std::runtime_error {
 public:
  explicit MigrationRecordError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Foreign key, CHECK or enum-domain violation.
class ConstraintViolation : public std::runtime_error {
 public:
  explicit ConstraintViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace sitely::util
