#pragma once

#include <stdexcept>
#include <string>

namespace dx {

class DiagnosisError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Illegal session or report transition. The record is left untouched.
class InvalidStateTransition : public DiagnosisError {
public:
  using DiagnosisError::DiagnosisError;
};

// Rejected at create_report / start_session time.
class ConfigurationError : public DiagnosisError {
public:
  using DiagnosisError::DiagnosisError;
};

// A submitted answer that fails boundary validation.
class InvalidResponse : public DiagnosisError {
public:
  using DiagnosisError::DiagnosisError;
};

class NotFound : public DiagnosisError {
public:
  using DiagnosisError::DiagnosisError;
};

// Raised by stores; the core never retries.
class PersistenceFailure : public DiagnosisError {
public:
  using DiagnosisError::DiagnosisError;
};

} // namespace dx
