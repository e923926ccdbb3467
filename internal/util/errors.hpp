#pragma once

#include <stdexcept>
#include <string>

namespace apparatus::util {

/*
  Central error types.

  InputError       malformed scope/reference or gate argument; aborts the call
  ProvenanceError  pack record without valid attribution; rejects that record
  ConflictError    concurrent write on the same unit; caller should retry
  IntegrityError   a store invariant would be violated despite the pre-check
*/

class InputError : public std::runtime_error {
 public:
  explicit InputError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProvenanceError : public std::runtime_error {
 public:
  explicit ProvenanceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConflictError : public std::runtime_error {
 public:
  explicit ConflictError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class IntegrityError : public std::runtime_error {
 public:
  explicit IntegrityError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace apparatus::util
