#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace healthstore::util {

/*
  Central error types.

  Callers distinguish "your data is wrong" (ValidationError) from
  "you called me in the wrong order" (InvalidState).
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidPermission : public ValidationError {
 public:
  explicit InvalidPermission(const std::string& msg) : ValidationError(msg) {
  }
};

class UnsupportedType : public ValidationError {
 public:
  explicit UnsupportedType(const std::string& msg) : ValidationError(msg) {
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

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Ordinary API traffic while a migration holds the store.
class MigrationInProgress : public InvalidState {
 public:
  explicit MigrationInProgress(const std::string& msg) : InvalidState(msg) {
  }
};

class InternalError : public std::runtime_error {
 public:
  explicit InternalError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

enum class EntityFailureKind {
  kInvalidPermission,
  kUnsupportedType,
  kInvalidEntity,
};

struct EntityFailure {
  std::string       entity_id;
  EntityFailureKind kind = EntityFailureKind::kInvalidEntity;
  std::string       message;
};

/*
  Raised after a migration batch committed its valid entities
  while one or more entities were rejected.
*/
class MigrationEntityError : public std::runtime_error {
 public:
  explicit MigrationEntityError(std::vector<EntityFailure> failures)
      : std::runtime_error(Describe(failures)), failures_(std::move(failures)) {
  }

  const std::vector<EntityFailure>& Failures() const {
    return failures_;
  }

 private:
  static std::string Describe(const std::vector<EntityFailure>& failures) {
    std::string msg = "failed to migrate " + std::to_string(failures.size()) + " entities:";
    for (const auto& failure : failures) {
      msg += " [" + failure.entity_id + ": " + failure.message + "]";
    }
    return msg;
  }

  std::vector<EntityFailure> failures_;
};

} // namespace healthstore::util
