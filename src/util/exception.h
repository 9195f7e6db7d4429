#pragma once

/// @file exception.h
/// @brief Exception classes for notescribe.

#include <stdexcept>
#include <string>

#include "util/types.h"

namespace notescribe {

/// @brief Base exception class for notescribe errors.
class NotescribeException : public std::runtime_error {
 public:
  /// @brief Constructs exception with error code.
  /// @param code Error code
  explicit NotescribeException(ErrorCode code)
      : std::runtime_error(error_message(code)), code_(code) {}

  /// @brief Constructs exception with error code and custom message.
  /// @param code Error code
  /// @param message Custom error message
  NotescribeException(ErrorCode code, const std::string& message)
      : std::runtime_error(message), code_(code) {}

  /// @brief Returns the error code.
  ErrorCode code() const { return code_; }

 private:
  ErrorCode code_;
};

/// @def NOTESCRIBE_CHECK
/// @brief Throws NotescribeException if condition is false.
#define NOTESCRIBE_CHECK(cond, code)   \
  do {                                 \
    if (!(cond)) {                     \
      throw NotescribeException(code); \
    }                                  \
  } while (0)

/// @def NOTESCRIBE_CHECK_MSG
/// @brief Throws NotescribeException with custom message if condition is false.
#define NOTESCRIBE_CHECK_MSG(cond, code, msg) \
  do {                                        \
    if (!(cond)) {                            \
      throw NotescribeException(code, msg);   \
    }                                         \
  } while (0)

}  // namespace notescribe
