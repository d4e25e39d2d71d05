#pragma once

#include <stdexcept>
#include <string>

// Base of every fatal error. main() maps all of them to exit status 1.
struct Pdf2MdError : std::runtime_error {
  explicit Pdf2MdError(const std::string& message) : std::runtime_error(message) {}
};

struct UsageError : Pdf2MdError {
  using Pdf2MdError::Pdf2MdError;
};

struct InputNotFoundError : Pdf2MdError {
  using Pdf2MdError::Pdf2MdError;
};

struct DefaultOutputDirMissingError : Pdf2MdError {
  using Pdf2MdError::Pdf2MdError;
};

struct OpenError : Pdf2MdError {
  using Pdf2MdError::Pdf2MdError;
};

struct WriteError : Pdf2MdError {
  using Pdf2MdError::Pdf2MdError;
};
