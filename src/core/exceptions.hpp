#pragma once

#include <stdexcept>
#include <string>

namespace neo {

enum class ErrorCode {
    SourceTimeout,
    SourceFailure,
    InsufficientQuorum,
    UnsupportedSymbol,
    MaxFeedsExceeded,
    DuplicateID,
    NotFound,
    InvalidSchedule,
    InvalidCondition,
    InvalidTrigger,
    TriggerLimitExceeded,
    Configuration,
    Execution
};

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SourceTimeout: return "SourceTimeout";
        case ErrorCode::SourceFailure: return "SourceFailure";
        case ErrorCode::InsufficientQuorum: return "InsufficientQuorum";
        case ErrorCode::UnsupportedSymbol: return "UnsupportedSymbol";
        case ErrorCode::MaxFeedsExceeded: return "MaxFeedsExceeded";
        case ErrorCode::DuplicateID: return "DuplicateID";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidSchedule: return "InvalidSchedule";
        case ErrorCode::InvalidCondition: return "InvalidCondition";
        case ErrorCode::InvalidTrigger: return "InvalidTrigger";
        case ErrorCode::TriggerLimitExceeded: return "TriggerLimitExceeded";
        case ErrorCode::Configuration: return "Configuration";
        case ErrorCode::Execution: return "Execution";
    }
    return "Unknown";
}

class NeoException : public std::runtime_error {
public:
    NeoException(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class DuplicateIdError : public NeoException {
public:
    explicit DuplicateIdError(const std::string& id)
        : NeoException(ErrorCode::DuplicateID, "Trigger with ID " + id + " already exists") {}
};

class NotFoundError : public NeoException {
public:
    explicit NotFoundError(const std::string& message)
        : NeoException(ErrorCode::NotFound, message) {}
};

class InvalidScheduleError : public NeoException {
public:
    explicit InvalidScheduleError(const std::string& message)
        : NeoException(ErrorCode::InvalidSchedule, "Invalid schedule: " + message) {}
};

class InvalidConditionError : public NeoException {
public:
    explicit InvalidConditionError(const std::string& message)
        : NeoException(ErrorCode::InvalidCondition, "Invalid condition: " + message) {}
};

class InvalidTriggerError : public NeoException {
public:
    explicit InvalidTriggerError(const std::string& message)
        : NeoException(ErrorCode::InvalidTrigger, "Invalid trigger: " + message) {}
};

class TriggerLimitError : public NeoException {
public:
    explicit TriggerLimitError(const std::string& message)
        : NeoException(ErrorCode::TriggerLimitExceeded, message) {}
};

class UnsupportedSymbolError : public NeoException {
public:
    explicit UnsupportedSymbolError(const std::string& symbol)
        : NeoException(ErrorCode::UnsupportedSymbol, "Unsupported symbol: " + symbol) {}
};

class MaxFeedsExceededError : public NeoException {
public:
    explicit MaxFeedsExceededError(int max_feeds)
        : NeoException(ErrorCode::MaxFeedsExceeded,
                       "Cannot track more than " + std::to_string(max_feeds) + " price feeds") {}
};

// Failure of a single price source during one aggregation cycle
class SourceError : public NeoException {
public:
    SourceError(ErrorCode code, const std::string& source, const std::string& message)
        : NeoException(code, source + ": " + message), source_(source) {}

    const std::string& source() const { return source_; }

private:
    std::string source_;
};

class ConfigurationError : public NeoException {
public:
    explicit ConfigurationError(const std::string& message)
        : NeoException(ErrorCode::Configuration, "Configuration Error: " + message) {}
};

class ExecutionError : public NeoException {
public:
    explicit ExecutionError(const std::string& message)
        : NeoException(ErrorCode::Execution, "Execution Error: " + message) {}
};

} // namespace neo
