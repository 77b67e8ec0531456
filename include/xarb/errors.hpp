// xarb - Error Types
// Exception taxonomy for coordination failures

#pragma once

#include <stdexcept>
#include <string>

namespace xarb {

// Base class for every error raised by the coordination layer
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

// State machine misuse - always a caller bug, never retried
class InvalidTransition : public Error {
public:
    explicit InvalidTransition(const std::string& msg) : Error(msg) {}
};

class UnknownOperation : public Error {
public:
    explicit UnknownOperation(const std::string& operation_id)
        : Error("Unknown operation: " + operation_id) {}
};

// Expected and recoverable by not proceeding
class InsufficientBalance : public Error {
public:
    explicit InsufficientBalance(const std::string& msg) : Error(msg) {}
};

// Exchange-originated failures
class ExchangeError : public Error {
public:
    explicit ExchangeError(const std::string& msg) : Error(msg) {}
};

class ExchangeUnavailable : public ExchangeError {
public:
    explicit ExchangeUnavailable(const std::string& exchange)
        : ExchangeError("Exchange not available: " + exchange) {}
};

class OrderRejected : public ExchangeError {
public:
    explicit OrderRejected(const std::string& msg) : ExchangeError(msg) {}
};

class OrderTimeout : public ExchangeError {
public:
    explicit OrderTimeout(const std::string& msg) : ExchangeError(msg) {}
};

// Plan partially filled - always routes to recovery
class AtomicityViolation : public Error {
public:
    explicit AtomicityViolation(const std::string& msg) : Error(msg) {}
};

// Recovery attempts capped - always escalates
class RecoveryExhausted : public Error {
public:
    explicit RecoveryExhausted(const std::string& msg) : Error(msg) {}
};

class RecoveryNotFound : public Error {
public:
    explicit RecoveryNotFound(const std::string& recovery_id)
        : Error("Recovery not found: " + recovery_id) {}
};

class PositionNotFound : public Error {
public:
    explicit PositionNotFound(const std::string& position_id)
        : Error("Position not found: " + position_id) {}
};

class UnsupportedOpportunity : public Error {
public:
    explicit UnsupportedOpportunity(const std::string& msg) : Error(msg) {}
};

// Opportunity screened out before an operation was created
class OpportunityRejected : public Error {
public:
    explicit OpportunityRejected(const std::string& msg) : Error(msg) {}
};

class ConcurrencyLimit : public Error {
public:
    explicit ConcurrencyLimit(const std::string& msg) : Error(msg) {}
};

class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& msg) : Error(msg) {}
};

}  // namespace xarb
