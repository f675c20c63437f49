#pragma once

#include <stdexcept>
#include <string>

class ShiftError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid request; raised before any side effect.
class ConfigurationError : public ShiftError {
public:
    using ShiftError::ShiftError;
};

class SourceNotFoundError : public ShiftError {
public:
    using ShiftError::ShiftError;
};

// Short or partial file, dropped connection, malformed frame.
class TransferError : public ShiftError {
public:
    using ShiftError::ShiftError;
};

class DatabaseError : public ShiftError {
public:
    using ShiftError::ShiftError;
};

// Stop/start failures. Callers record these as warnings.
class ServiceControlError : public ShiftError {
public:
    using ShiftError::ShiftError;
};

// Unwinds a worker after a cooperative cancellation checkpoint.
class CancelledError : public ShiftError {
public:
    CancelledError() : ShiftError("Operation cancelled") {}
};
