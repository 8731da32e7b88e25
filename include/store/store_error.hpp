#ifndef CHUNKSTORE_STORE_ERROR_HPP
#define CHUNKSTORE_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace chunkstore {
namespace store {

enum class ErrorCode {
  INVALID_ID,
  INVALID_INPUT,
  NOT_FOUND,
  STORE_UNAVAILABLE,
  INCOMPLETE_OBJECT,
  CONNECTION_ERROR
};

inline const char* error_code_to_string(ErrorCode code) {
  switch (code) {
    case ErrorCode::INVALID_ID: return "Invalid id";
    case ErrorCode::INVALID_INPUT: return "Invalid input";
    case ErrorCode::NOT_FOUND: return "Not found";
    case ErrorCode::STORE_UNAVAILABLE: return "Store unavailable";
    case ErrorCode::INCOMPLETE_OBJECT: return "Incomplete object";
    case ErrorCode::CONNECTION_ERROR: return "Connection error";
    default: return "Undefined error";
  }
}

class StoreError : public std::runtime_error {
public:
  StoreError(ErrorCode code, const std::string& message)
    : std::runtime_error(std::string(error_code_to_string(code)) + ": " + message)
    , code_(code) {}

  ErrorCode code() const { return code_; }

private:
  ErrorCode code_;
};

// Object id string is not 24 hex digits
class InvalidIdError : public StoreError {
public:
  explicit InvalidIdError(const std::string& message) : StoreError(ErrorCode::INVALID_ID, message) {}
};

class InvalidInputError : public StoreError {
public:
  explicit InvalidInputError(const std::string& message) : StoreError(ErrorCode::INVALID_INPUT, message) {}
};

// No manifest exists for the id
class NotFoundError : public StoreError {
public:
  explicit NotFoundError(const std::string& message) : StoreError(ErrorCode::NOT_FOUND, message) {}
};

// The document store rejected or failed an operation
class StoreUnavailableError : public StoreError {
public:
  explicit StoreUnavailableError(const std::string& message) : StoreError(ErrorCode::STORE_UNAVAILABLE, message) {}
};

// Manifest exists but its chunks are missing, mis-sized or malformed
class IncompleteObjectError : public StoreError {
public:
  explicit IncompleteObjectError(const std::string& message) : StoreError(ErrorCode::INCOMPLETE_OBJECT, message) {}
};

class ConnectionError : public StoreError {
public:
  explicit ConnectionError(const std::string& message) : StoreError(ErrorCode::CONNECTION_ERROR, message) {}
};

} // namespace store
} // namespace chunkstore

#endif // CHUNKSTORE_STORE_ERROR_HPP
