#ifndef ENZYME_ERRORS_HPP
#define ENZYME_ERRORS_HPP

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace enzyme {

// =============================================================================
// Fee Errors
// =============================================================================
// Every failure of the fee engine is a FeeError carrying one of the
// errors:: codes. Errors are never retried; the enclosing hook dispatch is
// rolled back before the exception reaches the caller.

class FeeError : public std::runtime_error {
public:
    FeeError(int32_t code, const std::string& msg) : std::runtime_error(msg), code_(code) {}

    int32_t code() const noexcept { return code_; }

private:
    int32_t code_;
};

class RateOutOfRangeError : public FeeError {
public:
    explicit RateOutOfRangeError(const std::string& msg) : FeeError(errors::RATE_OUT_OF_RANGE, msg) {}
};

class ArithmeticOverflowError : public FeeError {
public:
    explicit ArithmeticOverflowError(const std::string& msg) : FeeError(errors::ARITHMETIC_OVERFLOW, msg) {}
};

class AlreadyConfiguredError : public FeeError {
public:
    explicit AlreadyConfiguredError(const std::string& msg) : FeeError(errors::ALREADY_CONFIGURED, msg) {}
};

class NotMonotonicError : public FeeError {
public:
    explicit NotMonotonicError(const std::string& msg) : FeeError(errors::NOT_MONOTONIC, msg) {}
};

class UnauthorizedCallerError : public FeeError {
public:
    explicit UnauthorizedCallerError(const std::string& msg) : FeeError(errors::UNAUTHORIZED, msg) {}
};

class UnknownFeeKindError : public FeeError {
public:
    explicit UnknownFeeKindError(const std::string& msg) : FeeError(errors::UNKNOWN_FEE_KIND, msg) {}
};

class FundNotInitializedError : public FeeError {
public:
    explicit FundNotInitializedError(const std::string& msg) : FeeError(errors::FUND_NOT_INITIALIZED, msg) {}
};

class InsufficientSharesError : public FeeError {
public:
    explicit InsufficientSharesError(const std::string& msg) : FeeError(errors::INSUFFICIENT_BALANCE, msg) {}
};

class ValueDueExceedsGavError : public FeeError {
public:
    explicit ValueDueExceedsGavError(const std::string& msg) : FeeError(errors::VALUE_DUE_EXCEEDS_GAV, msg) {}
};

class GavUnavailableError : public FeeError {
public:
    explicit GavUnavailableError(const std::string& msg) : FeeError(errors::ORACLE_SOURCE_UNAVAILABLE, msg) {}
};

class InvalidSettingsError : public FeeError {
public:
    explicit InvalidSettingsError(const std::string& msg) : FeeError(errors::INVALID_SETTINGS, msg) {}
};

class ConfigError : public FeeError {
public:
    explicit ConfigError(const std::string& msg) : FeeError(errors::INVALID_CONFIG, msg) {}
};

// Throws UnauthorizedCallerError unless caller == expected
void require_caller(const Address& caller, const Address& expected, const char* what);

} // namespace enzyme

#endif // ENZYME_ERRORS_HPP
