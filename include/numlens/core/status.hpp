#ifndef NUMLENS_CORE_STATUS_HPP
#define NUMLENS_CORE_STATUS_HPP

// Return-status error reporting.
//
// Every fallible operation returns a Result<T>: the value together with
// an ErrorKind and a human-readable message. Nothing in the core throws,
// and a failed Result leaves the caller's previous state untouched.

#include <string>
#include <utility>

namespace numlens {

enum class ErrorKind {
  None,
  InvalidNumeral,      // text cannot be parsed in the requested base
  InvalidDecimal,      // text is not a decimal literal
  MalformedBitPattern, // wrong length or non-binary characters
  UnsupportedWidth,    // integer type or float format outside the catalog
  UnsupportedBase,     // radix other than 2, 10 or 16
  NotWholeNumber,      // integer mode given a fraction or non-finite value
};

inline const char *errorKindName(ErrorKind K) {
  switch (K) {
  case ErrorKind::None:                return "None";
  case ErrorKind::InvalidNumeral:      return "InvalidNumeral";
  case ErrorKind::InvalidDecimal:      return "InvalidDecimal";
  case ErrorKind::MalformedBitPattern: return "MalformedBitPattern";
  case ErrorKind::UnsupportedWidth:    return "UnsupportedWidth";
  case ErrorKind::UnsupportedBase:     return "UnsupportedBase";
  case ErrorKind::NotWholeNumber:      return "NotWholeNumber";
  }
  return "???";
}

template <typename T> struct Result {
  T Value{};
  ErrorKind Error = ErrorKind::None;
  std::string Message;

  bool ok() const { return Error == ErrorKind::None; }
  explicit operator bool() const { return ok(); }

  static Result success(T V) {
    Result R;
    R.Value = std::move(V);
    return R;
  }

  static Result failure(ErrorKind K, std::string Msg) {
    Result R;
    R.Error = K;
    R.Message = std::move(Msg);
    return R;
  }

  // Re-tag a failure for a different value type.
  template <typename U> static Result from(const Result<U> &Failed) {
    return failure(Failed.Error, Failed.Message);
  }
};

} // namespace numlens

#endif // NUMLENS_CORE_STATUS_HPP
