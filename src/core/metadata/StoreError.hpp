#pragma once
#include <stdexcept>
#include <string>

namespace urlsh {

enum class ErrorKind {
  InvalidInput,
  NotFound,
  ExhaustedRetries,
  StorageUnavailable
};

inline const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::InvalidInput:       return "InvalidInput";
    case ErrorKind::NotFound:           return "NotFound";
    case ErrorKind::ExhaustedRetries:   return "ExhaustedRetries";
    case ErrorKind::StorageUnavailable: return "StorageUnavailable";
  }
  return "Unknown";
}

class StoreError : public std::runtime_error {
public:
  StoreError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace urlsh
