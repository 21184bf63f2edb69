#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

enum class SourceErrorKind { Timeout, Unavailable, Malformed };
enum class ValidationErrorKind { InsufficientSources, Inconsistent };
enum class QuoteErrorKind { NoRoute, RouteDivergence, ProviderError };
enum class ExecutionErrorKind {
    Unconfirmed,      // broadcast, confirmation not observed in time; may still land
    OnChainFailure,   // transaction landed with an error or was rejected by preflight
    SubmissionFailed, // transport or provider failure before the transaction was accepted
    QuoteExpired,     // quote passed expires_at before broadcast
    CircuitOpen
};

const char* to_string(SourceErrorKind kind);
const char* to_string(ValidationErrorKind kind);
const char* to_string(QuoteErrorKind kind);
const char* to_string(ExecutionErrorKind kind);

// Raised by a single price source. Never fatal to the trade; the validator
// excludes the source from consensus.
class SourceError : public std::runtime_error {
public:
    SourceError(SourceErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    SourceErrorKind kind() const { return kind_; }

private:
    SourceErrorKind kind_;
};

class ValidationError : public std::runtime_error {
public:
    ValidationError(ValidationErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ValidationErrorKind kind() const { return kind_; }
    bool is_transient() const { return kind_ == ValidationErrorKind::InsufficientSources; }

private:
    ValidationErrorKind kind_;
};

class QuoteError : public std::runtime_error {
public:
    QuoteError(QuoteErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    QuoteErrorKind kind() const { return kind_; }
    bool is_transient() const { return kind_ == QuoteErrorKind::ProviderError; }

private:
    QuoteErrorKind kind_;
};

class ExecutionError : public std::runtime_error {
public:
    ExecutionError(ExecutionErrorKind kind, const std::string& message,
                   std::string signature = "", uint64_t last_valid_block_height = 0)
        : std::runtime_error(message), kind_(kind), signature_(std::move(signature)),
          last_valid_block_height_(last_valid_block_height) {}

    ExecutionErrorKind kind() const { return kind_; }

    // Set for Unconfirmed (and OnChainFailure when the transaction landed)
    const std::string& signature() const { return signature_; }

    // Expiry of the broadcast behind signature(); 0 when unknown
    uint64_t last_valid_block_height() const { return last_valid_block_height_; }

    bool is_transient() const {
        return kind_ == ExecutionErrorKind::Unconfirmed ||
               kind_ == ExecutionErrorKind::SubmissionFailed ||
               kind_ == ExecutionErrorKind::QuoteExpired;
    }

private:
    ExecutionErrorKind kind_;
    std::string signature_;
    uint64_t last_valid_block_height_;
};

// The caller gave up before anything was broadcast.
class OperationCancelled : public std::runtime_error {
public:
    explicit OperationCancelled(const std::string& stage)
        : std::runtime_error("cancelled during " + stage) {}
};
