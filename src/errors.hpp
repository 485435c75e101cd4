#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
  InvalidConfiguration,
  SourceNotFound,
  Unauthorized,
  ItemNotFound,
  IOFailure
};

const char* error_kind_name(ErrorKind kind);

class TransferError : public std::runtime_error {
public:
  TransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

  // Startup errors abort the process before any socket is opened.
  bool fatal_at_startup() const {
    return kind_ == ErrorKind::InvalidConfiguration || kind_ == ErrorKind::SourceNotFound;
  }

private:
  ErrorKind kind_;
};

class InvalidConfiguration : public TransferError {
public:
  explicit InvalidConfiguration(const std::string& message)
    : TransferError(ErrorKind::InvalidConfiguration, message) {}
};

class SourceNotFound : public TransferError {
public:
  explicit SourceNotFound(const std::string& message)
    : TransferError(ErrorKind::SourceNotFound, message) {}
};

class Unauthorized : public TransferError {
public:
  Unauthorized() : TransferError(ErrorKind::Unauthorized, "token invalid or expired") {}
};

class ItemNotFound : public TransferError {
public:
  explicit ItemNotFound(const std::string& message)
    : TransferError(ErrorKind::ItemNotFound, message) {}
};

class IOFailure : public TransferError {
public:
  explicit IOFailure(const std::string& message)
    : TransferError(ErrorKind::IOFailure, message) {}
};
