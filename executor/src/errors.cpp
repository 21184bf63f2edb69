#include "errors.hpp"

const char* to_string(SourceErrorKind kind) {
    switch (kind) {
        case SourceErrorKind::Timeout: return "timeout";
        case SourceErrorKind::Unavailable: return "unavailable";
        case SourceErrorKind::Malformed: return "malformed";
    }
    return "unknown";
}

const char* to_string(ValidationErrorKind kind) {
    switch (kind) {
        case ValidationErrorKind::InsufficientSources: return "insufficient_sources";
        case ValidationErrorKind::Inconsistent: return "inconsistent";
    }
    return "unknown";
}

const char* to_string(QuoteErrorKind kind) {
    switch (kind) {
        case QuoteErrorKind::NoRoute: return "no_route";
        case QuoteErrorKind::RouteDivergence: return "route_divergence";
        case QuoteErrorKind::ProviderError: return "provider_error";
    }
    return "unknown";
}

const char* to_string(ExecutionErrorKind kind) {
    switch (kind) {
        case ExecutionErrorKind::Unconfirmed: return "unconfirmed";
        case ExecutionErrorKind::OnChainFailure: return "on_chain_failure";
        case ExecutionErrorKind::SubmissionFailed: return "submission_failed";
        case ExecutionErrorKind::QuoteExpired: return "quote_expired";
        case ExecutionErrorKind::CircuitOpen: return "circuit_open";
    }
    return "unknown";
}
